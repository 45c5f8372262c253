#ifndef SERVER_IO_H_
#define SERVER_IO_H_

#include <string>
#include <httplib.h>
#include <lmsjudge/lifecycle.h>
#include <lmsjudge/leaderboard.h>

extern std::string kListenHost;
extern int kListenPort;
extern size_t kServerThreads;

// Install every route of the judge API on svr. The manager and aggregator must
// outlive the server.
void RegisterRoutes(httplib::Server& svr, SubmissionManager& manager, const LeaderboardAggregator& leaderboard);

// Listen on kListenHost:kListenPort until the server is stopped.
// Return false if the address cannot be bound.
bool ServerWorkLoop(SubmissionManager& manager, const LeaderboardAggregator& leaderboard);

#endif  // SERVER_IO_H_
