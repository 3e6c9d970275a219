#include "tr2collapse.hpp"

#include <cassert>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "test_events.hpp"

namespace {

using tr2collapse::ConsistencyException;
using tr2collapse::InvocationRecord;
using tr2collapse::RegionRecord;
using tr2collapse::RegionSynthesizer;
using tr2collapse::SessionContext;
using tr2collapse::SessionEventStore;
using tr2collapse::WorktreeResolver;
using test_events::kBaseEpoch;

struct StoreHarness {
    SessionContext ctx;
    SessionEventStore store{ctx};
    tr2collapse::LineDecoder decoder;

    StoreHarness() = default;

    explicit StoreHarness(WorktreeResolver resolver) : ctx(std::move(resolver)) {}

    bool Apply(const std::string& line) {
        tr2collapse::DecodeResult result = decoder.decode(line);
        assert(result.ok());
        return store.apply(*result.event);
    }

    const InvocationRecord& Record(const std::string& sid) const {
        const InvocationRecord* record = ctx.find_invocation(sid);
        assert(record != nullptr);
        return *record;
    }
};

void TestVersionSetsVersion() {
    StoreHarness h;
    bool handled = h.Apply(test_events::Version("s1", "2.43.0"));
    assert(handled);
    assert(h.Record("s1").version == std::optional<std::string>("2.43.0"));
    assert(h.Record("s1").sid == "s1");
}

void TestSecondVersionIsFatal() {
    StoreHarness h;
    h.Apply(test_events::Version("s1"));

    bool threw = false;
    try {
        h.Apply(test_events::Version("s1"));
    } catch (const ConsistencyException&) {
        threw = true;
    }
    assert(threw && "a second version event must abort");
}

void TestVersionAfterOtherEventsIsFatal() {
    StoreHarness h;
    h.Apply(test_events::Start("s1", "10:00:00"));

    bool threw = false;
    try {
        h.Apply(test_events::Version("s1"));
    } catch (const ConsistencyException&) {
        threw = true;
    }
    assert(threw);
}

void TestVersionAfterIgnoredEventsIsAccepted() {
    StoreHarness h;
    h.Apply(test_events::RegionEnter("s1", "10:00:00", "index", "do_read_index"));
    h.Apply(test_events::AtExit("s1", "10:00:01"));
    h.Apply(R"({"event":"data","sid":"s1","key":"k","value":"v"})");

    assert(h.Record("s1").empty());
    h.Apply(test_events::Version("s1"));
    assert(h.Record("s1").version);
}

void TestStartSetsEpochAndArgv() {
    StoreHarness h;
    h.Apply(test_events::Start("s1", "10:00:00.25", R"(["git","status"])"));

    const InvocationRecord& record = h.Record("s1");
    assert(record.start_epoch == kBaseEpoch + 0.25);
    assert(record.argv);
    assert((*record.argv == std::vector<std::string>{"git", "status"}));
}

void TestCmdNameSetsHierarchy() {
    StoreHarness h;
    h.Apply(test_events::CmdName("s1", "submodule", "status/submodule"));

    const InvocationRecord& record = h.Record("s1");
    assert(record.cmd_name == std::optional<std::string>("submodule"));
    assert(record.hierarchy);
    assert((*record.hierarchy == std::vector<std::string>{"status", "submodule"}));
}

void TestDefRepoResolvesAndMemoizes() {
    int calls = 0;
    WorktreeResolver resolver([&calls](const std::string& path) -> std::optional<std::string> {
        ++calls;
        if (path == "/work/link") return std::string("/work/real");
        return std::nullopt;
    });
    StoreHarness h(std::move(resolver));

    h.Apply(test_events::DefRepo("s1", "/work/link"));
    h.Apply(test_events::DefRepo("s2", "/work/link"));
    h.Apply(test_events::DefRepo("s3", "/gone/away"));

    assert(h.Record("s1").worktree == std::optional<std::string>("/work/real"));
    assert(h.Record("s2").worktree == std::optional<std::string>("/work/real"));
    // 解析失败时保留原始字符串
    assert(h.Record("s3").worktree == std::optional<std::string>("/gone/away"));
    assert(calls == 2);
    assert(h.ctx.worktrees.cached() == 2);
}

void TestDefaultResolverFallsBack() {
    WorktreeResolver resolver;
    assert(resolver.resolve("/nonexistent/tr2collapse/worktree") == "/nonexistent/tr2collapse/worktree");
    assert(resolver.resolve("/") == "/");
}

void TestExitSetsEpochAndCode() {
    StoreHarness h;
    h.Apply(test_events::Exit("s1", "10:00:01.5", 128));

    const InvocationRecord& record = h.Record("s1");
    assert(record.exit_epoch == kBaseEpoch + 1.5);
    assert(record.exit_code == std::optional<int>(128));
}

void TestSignalSetsEpochAndSigno() {
    StoreHarness h;
    h.Apply(test_events::Signal("s1", "10:00:00.75", 15));

    const InvocationRecord& record = h.Record("s1");
    assert(record.signal_epoch == kBaseEpoch + 0.75);
    assert(record.signal_signo == std::optional<int>(15));
    assert(! record.exit_code);
}

void TestIgnoredEventsLeaveRecordUntouched() {
    StoreHarness h;
    const std::vector<std::string> lines = {
        test_events::AtExit("s1", "10:00:01"),
        R"({"event":"data","sid":"s1","category":"index","key":"read/cache_nr","value":"312"})",
        R"({"event":"child_start","sid":"s1","child_id":0,"argv":["git","gc","--auto"]})",
        R"({"event":"child_exit","sid":"s1","child_id":0,"code":0})",
        R"({"event":"exec","sid":"s1","exec_id":0,"argv":["ls"]})",
        R"({"event":"error","sid":"s1","msg":"pathspec did not match"})",
    };

    for (const auto& line : lines) {
        bool handled = h.Apply(line);
        assert(handled);
    }
    assert(h.Record("s1").empty());
}

void TestCmdModeAppends() {
    StoreHarness h;
    h.Apply(R"({"event":"cmd_mode","sid":"s1","name":"branch"})");
    h.Apply(R"({"event":"cmd_mode","sid":"s1","name":"path"})");

    assert((h.Record("s1").cmd_modes == std::vector<std::string>{"branch", "path"}));
}

void TestAliasSetsNameAndArgv() {
    StoreHarness h;
    h.Apply(R"({"event":"alias","sid":"s1","alias":"st","argv":["status","-sb"]})");

    const InvocationRecord& record = h.Record("s1");
    assert(record.alias == std::optional<std::string>("st"));
    assert(record.alias_argv);
    assert((*record.alias_argv == std::vector<std::string>{"status", "-sb"}));
}

void TestUnknownEventIsNotHandled() {
    StoreHarness h;
    bool handled = h.Apply(R"({"event":"th_start","sid":"s1","thread":"preload-01"})");
    assert(! handled);
    assert(h.Record("s1").empty());
}

void TestRegionEventsAccumulatePerLabel() {
    StoreHarness h;
    h.Apply(test_events::RegionEnter("s1", "10:00:00.75", "index", "do_read_index"));
    h.Apply(test_events::RegionEnter("s1", "10:00:00.25", "index", "do_read_index"));
    h.Apply(test_events::RegionLeave("s1", "10:00:00.5", "index", "do_read_index"));
    h.Apply(test_events::RegionEnter("s2", "10:00:00.25", "index", "do_read_index"));

    const std::string label = RegionSynthesizer::synthetic_label("index", "do_read_index");
    assert(label == std::string("REGION:index\x1C") + "do_read_index");

    const RegionRecord* region = h.ctx.find_region("s1", label);
    assert(region != nullptr);
    assert(region->sid == "s1");
    assert(region->enter_count == 2);
    assert(region->leave_count == 1);
    // 到达顺序保留, 配对留给对账阶段
    assert((region->enter_epochs == std::vector<double>{kBaseEpoch + 0.75, kBaseEpoch + 0.25}));
    assert((region->leave_epochs == std::vector<double>{kBaseEpoch + 0.5}));

    const RegionRecord* other = h.ctx.find_region("s2", label);
    assert(other != nullptr);
    assert(other->enter_count == 1);
    assert(h.ctx.regions.size() == 2);
}

void TestRegionLabelSlashesAreEscaped() {
    const std::string label = RegionSynthesizer::synthetic_label("submodule", "parallel/status");
    assert(label.find('/') == std::string::npos);
    assert(label == std::string("REGION:submodule\x1C") + "parallel\x1C" + "status");
}

void TestRegionWithoutTimeIsIgnored() {
    StoreHarness h;
    bool handled = h.Apply(R"({"event":"region_enter","sid":"s1","nesting":1,"category":"index","label":"x"})");
    assert(handled);
    assert(h.ctx.regions.empty());
}

} // namespace

int main() {
    TestVersionSetsVersion();
    TestSecondVersionIsFatal();
    TestVersionAfterOtherEventsIsFatal();
    TestVersionAfterIgnoredEventsIsAccepted();
    TestStartSetsEpochAndArgv();
    TestCmdNameSetsHierarchy();
    TestDefRepoResolvesAndMemoizes();
    TestDefaultResolverFallsBack();
    TestExitSetsEpochAndCode();
    TestSignalSetsEpochAndSigno();
    TestIgnoredEventsLeaveRecordUntouched();
    TestCmdModeAppends();
    TestAliasSetsNameAndArgv();
    TestUnknownEventIsNotHandled();
    TestRegionEventsAccumulatePerLabel();
    TestRegionLabelSlashesAreEscaped();
    TestRegionWithoutTimeIsIgnored();

    std::cout << "tr2collapse_unit_session_store: pass\n";
    return 0;
}
