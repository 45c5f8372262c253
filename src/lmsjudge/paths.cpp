#include "paths.h"

fs::path kBoxRoot = "/tmp/lmsjudge_box";

namespace {

inline std::string PadInt(long x, size_t width) {
  std::string ret = std::to_string(x);
  if (ret.size() < width) ret = std::string(width - ret.size(), '0') + ret;
  return ret;
}

// javac requires the file name to match the public class
inline std::string SourceName(Language lang) {
  switch (lang) {
    case Language::C: return "prog.c";
    case Language::CPP: return "prog.cpp";
    case Language::JAVA: return "Main.java";
    case Language::PYTHON: return "prog.py";
    case Language::JAVASCRIPT: return "prog.js";
    case Language::UNSUPPORTED: return "prog";
  }
  __builtin_unreachable();
}

inline std::string ProgramName(Language lang) {
  switch (lang) {
    case Language::C: [[fallthrough]];
    case Language::CPP: return "prog";
    case Language::JAVA: return "Main.class";
    case Language::PYTHON: [[fallthrough]];
    case Language::JAVASCRIPT: [[fallthrough]];
    case Language::UNSUPPORTED: return SourceName(lang);
  }
  __builtin_unreachable();
}

} // namespace

fs::path BoxPath(long id) {
  return kBoxRoot / PadInt(id, 6);
}
fs::path BoxSource(long id, Language lang) {
  return BoxPath(id) / SourceName(lang);
}
fs::path BoxProgram(long id, Language lang) {
  return BoxPath(id) / ProgramName(lang);
}
fs::path BoxInput(long id) {
  return BoxPath(id) / "input";
}
fs::path BoxOutput(long id) {
  return BoxPath(id) / "output";
}
fs::path BoxError(long id) {
  return BoxPath(id) / "error";
}
fs::path BoxCompileMessage(long id) {
  return BoxPath(id) / "compile_message";
}
