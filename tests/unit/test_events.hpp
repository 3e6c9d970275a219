#pragma once

#include <string>

// trace2 event 行构造, 时间都落在 2024-01-01 UTC
namespace test_events {

// 2024-01-01T10:00:00Z
inline constexpr double kBaseEpoch = 1704103200.0;

inline std::string Time(const std::string& clock) {
    return "2024-01-01T" + clock + "Z";
}

inline std::string Version(const std::string& sid, const std::string& exe = "2.43.0") {
    return R"({"event":"version","sid":")" + sid + R"(","thread":"main","evt":"3","exe":")" + exe + R"("})";
}

inline std::string Start(const std::string& sid, const std::string& clock, const std::string& argv = R"(["git"])") {
    return R"({"event":"start","sid":")" + sid + R"(","thread":"main","time":")" + Time(clock) + R"(","t_abs":0.001,"argv":)" +
           argv + "}";
}

inline std::string CmdName(const std::string& sid, const std::string& name, const std::string& hierarchy) {
    return R"({"event":"cmd_name","sid":")" + sid + R"(","thread":"main","name":")" + name + R"(","hierarchy":")" +
           hierarchy + R"("})";
}

inline std::string DefRepo(const std::string& sid, const std::string& worktree) {
    return R"({"event":"def_repo","sid":")" + sid + R"(","thread":"main","repo":1,"worktree":")" + worktree + R"("})";
}

inline std::string Exit(const std::string& sid, const std::string& clock, int code = 0) {
    return R"({"event":"exit","sid":")" + sid + R"(","thread":"main","time":")" + Time(clock) + R"(","t_abs":1.0,"code":)" +
           std::to_string(code) + "}";
}

inline std::string AtExit(const std::string& sid, const std::string& clock, int code = 0) {
    return R"({"event":"atexit","sid":")" + sid + R"(","thread":"main","time":")" + Time(clock) + R"(","code":)" +
           std::to_string(code) + "}";
}

inline std::string Signal(const std::string& sid, const std::string& clock, int signo) {
    return R"({"event":"signal","sid":")" + sid + R"(","thread":"main","time":")" + Time(clock) + R"(","signo":)" +
           std::to_string(signo) + "}";
}

inline std::string Region(const std::string& type, const std::string& sid, const std::string& clock,
                          const std::string& category, const std::string& label) {
    return R"({"event":")" + type + R"(","sid":")" + sid + R"(","thread":"main","time":")" + Time(clock) +
           R"(","repo":1,"nesting":1,"category":")" + category + R"(","label":")" + label + R"("})";
}

inline std::string RegionEnter(const std::string& sid, const std::string& clock, const std::string& category,
                               const std::string& label) {
    return Region("region_enter", sid, clock, category, label);
}

inline std::string RegionLeave(const std::string& sid, const std::string& clock, const std::string& category,
                               const std::string& label) {
    return Region("region_leave", sid, clock, category, label);
}

} // namespace test_events
