#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <fcntl.h>
#include <sys/mman.h>
#include <unistd.h>

#include <json/json.h>

#include "tr2collapse_log.hpp"

namespace tr2collapse {

class Tr2CollapseException : public std::runtime_error {
  public:
    explicit Tr2CollapseException(std::string_view message)
        : std::runtime_error(std::string("tr2collapse Error: ") + std::string(message)) {}
};

class MemoryException : public std::runtime_error {
  public:
    explicit MemoryException(std::string_view message)
        : std::runtime_error(std::string("Memory Error: ") + std::string(message)) {}
};

class OpenFileException : public std::runtime_error {
  public:
    explicit OpenFileException(std::string_view message)
        : std::runtime_error(std::string("Cannot open file: ") + std::string(message)) {}
};

// 可解码但无法归属到任何 invocation 的行
class FatalEventException : public Tr2CollapseException {
  public:
    explicit FatalEventException(std::string_view message)
        : Tr2CollapseException(std::string("Fatal Event: ") + std::string(message)) {}
};

// 事件流自相矛盾: 重复的 version, leave 多于 enter
class ConsistencyException : public Tr2CollapseException {
  public:
    explicit ConsistencyException(std::string_view message)
        : Tr2CollapseException(std::string("Consistency Error: ") + std::string(message)) {}
};

class ConfigException : public Tr2CollapseException {
  public:
    explicit ConfigException(std::string_view message)
        : Tr2CollapseException(std::string("Config Error: ") + std::string(message)) {}
};

using Epoch = double;

inline constexpr char HIERARCHY_SEPARATOR = '/';
// 栈帧之间的内部分隔符; 不可打印, 命令名和 region 名里的 ';' 原样保留
inline constexpr char JOIN_MARKER = '\x1D';
inline constexpr char LABEL_PLACEHOLDER = '\x1C';
inline constexpr std::string_view REGION_PREFIX = "REGION:";
inline constexpr std::string_view ERROR_HIERARCHY = "__error__";

// 输出单位是 100000 * 秒差, 不是真正的微秒; 下游只把它当作累加值
inline constexpr double DURATION_SCALE = 100000.0;

namespace detail {
inline std::string_view trim(std::string_view str) {
    const auto first = str.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

struct MMapBuffer {
    void* addr = nullptr;
    size_t size = 0;

    explicit MMapBuffer(const std::string& filename) {
        int fd = open(filename.c_str(), O_RDONLY);
        if (fd == -1) throw OpenFileException(filename);

        off_t end = lseek(fd, 0, SEEK_END);
        if (end == static_cast<off_t>(-1)) {
            close(fd);
            throw OpenFileException(filename);
        }
        size = static_cast<size_t>(end);

        // 空文件 mmap 会返回 EINVAL, 直接当作空 buffer
        if (size > 0) {
            addr = mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
            if (addr == MAP_FAILED) {
                close(fd);
                throw MemoryException("mmap failed for " + filename);
            }
            madvise(addr, size, MADV_WILLNEED);
        }
        close(fd);
    }

    ~MMapBuffer() {
        if (addr != nullptr) {
            munmap(addr, size);
        }
    }

    MMapBuffer(const MMapBuffer&) = delete;
    MMapBuffer& operator=(const MMapBuffer&) = delete;

    std::string_view view() const {
        if (addr == nullptr) return {};
        return {static_cast<const char*>(addr), size};
    }
};

struct LineScanner {
    std::string_view buffer;
    size_t pos = 0;
    size_t line_number = 0;

    explicit LineScanner(std::string_view data) : buffer(data) {}

    // 获取下一行，trim 后返回；如果读完，返回空 view
    std::string_view next_trimmed_line() {
        if (pos >= buffer.size()) {
            return {};
        }

        size_t end = buffer.find('\n', pos);
        if (end == std::string_view::npos) end = buffer.size();

        std::string_view line = buffer.substr(pos, end - pos);
        pos = end + 1;
        line_number++;

        return trim(line);
    }

    bool eof() const {
        return pos >= buffer.size();
    }
};

inline std::vector<std::string> split(std::string_view str, char delimiter) {
    std::vector<std::string> tokens;

    size_t start = 0;
    while (true) {
        size_t end = str.find(delimiter, start);
        if (end == std::string_view::npos) {
            tokens.emplace_back(str.substr(start));
            break;
        }
        tokens.emplace_back(str.substr(start, end - start));
        start = end + 1;
    }

    return tokens;
}

inline std::string join(const std::vector<std::string>& parts, char delimiter) {
    std::string joined;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) joined += delimiter;
        joined += parts[i];
    }
    return joined;
}

inline std::string replace_char(std::string_view str, char from, char to) {
    std::string replaced(str);
    std::replace(replaced.begin(), replaced.end(), from, to);
    return replaced;
}

inline bool read_digits(std::string_view text, size_t& pos, size_t count, int& out) {
    if (pos + count > text.size()) return false;
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = text[pos + i];
        if (c < '0' || c > '9') return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    pos += count;
    return true;
}

inline bool expect_char(std::string_view text, size_t& pos, char expected) {
    if (pos >= text.size() || text[pos] != expected) return false;
    ++pos;
    return true;
}

} // namespace detail

/**
 * @brief 解析 trace2 的时间戳, 返回带小数的 epoch 秒
 *
 * i.e. "2019-05-13T11:33:44.245652Z", 也接受 "+02:00" / "+0200" 偏移和空格分隔.
 * 没有时区后缀时按 UTC 处理. 解析失败返回 nullopt.
 */
inline std::optional<Epoch> parse_epoch(std::string_view text) {
    using detail::expect_char;
    using detail::read_digits;

    text = detail::trim(text);
    size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    if (! read_digits(text, pos, 4, year) || ! expect_char(text, pos, '-') || ! read_digits(text, pos, 2, month) ||
        ! expect_char(text, pos, '-') || ! read_digits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ')) {
        return std::nullopt;
    }
    ++pos;
    if (! read_digits(text, pos, 2, hour) || ! expect_char(text, pos, ':') || ! read_digits(text, pos, 2, minute) ||
        ! expect_char(text, pos, ':') || ! read_digits(text, pos, 2, second)) {
        return std::nullopt;
    }

    double fraction = 0.0;
    if (pos < text.size() && text[pos] == '.') {
        size_t start = pos++;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            ++pos;
        }
        if (pos == start + 1) return std::nullopt;
        fraction = std::strtod(std::string(text.substr(start, pos - start)).c_str(), nullptr);
    }

    long offset_seconds = 0;
    if (pos < text.size()) {
        char zone = text[pos];
        if (zone == 'Z' || zone == 'z') {
            ++pos;
        } else if (zone == '+' || zone == '-') {
            ++pos;
            int offset_hours = 0, offset_minutes = 0;
            if (! read_digits(text, pos, 2, offset_hours)) return std::nullopt;
            if (pos < text.size() && text[pos] == ':') ++pos;
            if (pos < text.size() && ! read_digits(text, pos, 2, offset_minutes)) return std::nullopt;
            offset_seconds = (offset_hours * 3600L + offset_minutes * 60L) * (zone == '-' ? -1 : 1);
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) return std::nullopt;

    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    time_t seconds = timegm(&tm);

    return static_cast<Epoch>(seconds - offset_seconds) + fraction;
}

// 每一段单独截断, 和 "%d" 格式化一致 (向零截断)
inline int64_t scaled_duration(Epoch start, Epoch end) {
    return static_cast<int64_t>(DURATION_SCALE * (end - start));
}

// 🔥 ===== 事件 =====
struct VersionEvent {
    std::string exe;
};

struct StartEvent {
    std::optional<Epoch> time;
    std::vector<std::string> argv;
};

struct CmdNameEvent {
    std::string name;
    std::optional<std::vector<std::string>> hierarchy;
};

struct DefRepoEvent {
    std::string worktree;
};

struct ExitEvent {
    std::optional<Epoch> time;
    int code = 0;
};

struct AtExitEvent {};

struct SignalEvent {
    std::optional<Epoch> time;
    int signo = 0;
};

struct ErrorEvent {
    std::string msg;
};

struct DataEvent {};

struct ChildStartEvent {};

struct ChildExitEvent {};

struct ExecEvent {};

struct CmdModeEvent {
    std::string name;
};

struct AliasEvent {
    std::string alias;
    std::vector<std::string> argv;
};

struct RegionMarker {
    std::optional<Epoch> time;
    int nesting = 0;
    std::string category;
    std::string label;
};

struct RegionEnterEvent : RegionMarker {};

struct RegionLeaveEvent : RegionMarker {};

// 未知类型只保留 Event::type
struct UnknownEvent {};

using EventPayload = std::variant<VersionEvent,
                                  StartEvent,
                                  CmdNameEvent,
                                  DefRepoEvent,
                                  ExitEvent,
                                  AtExitEvent,
                                  SignalEvent,
                                  ErrorEvent,
                                  DataEvent,
                                  ChildStartEvent,
                                  ChildExitEvent,
                                  ExecEvent,
                                  CmdModeEvent,
                                  AliasEvent,
                                  RegionEnterEvent,
                                  RegionLeaveEvent,
                                  UnknownEvent>;

struct Event {
    std::string sid;
    std::string type;
    EventPayload payload;
};

struct DecodeResult {
    enum class Status { ok, skip, fatal };

    Status status = Status::skip;
    std::optional<Event> event;
    Json::Value decoded; // 诊断回显用
    std::string reason;

    bool ok() const {
        return status == Status::ok;
    }
};

inline std::string pretty_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, value);
}

// 🔥 ===== 行解码 =====
class LineDecoder {
  public:
    LineDecoder() {
        Json::CharReaderBuilder builder;
        builder["collectComments"] = false;
        builder["allowComments"] = false;
        builder["failIfExtra"] = true;
        reader_.reset(builder.newCharReader());
    }

    DecodeResult decode(std::string_view line) const {
        DecodeResult result;
        if (line.empty()) {
            result.reason = "empty line";
            return result;
        }

        Json::String errors;
        if (! reader_->parse(line.data(), line.data() + line.size(), &result.decoded, &errors)) {
            result.status = DecodeResult::Status::skip;
            result.reason = errors;
            return result;
        }
        if (! result.decoded.isObject()) {
            result.status = DecodeResult::Status::skip;
            result.reason = "not a JSON object";
            return result;
        }

        const Json::Value& root = result.decoded;
        const Json::Value& sid = root["sid"];
        std::string sid_text;
        if (sid.isString() || sid.isIntegral()) {
            sid_text = sid.asString();
        }
        if (sid_text.empty()) {
            result.status = DecodeResult::Status::fatal;
            result.reason = "no sid";
            return result;
        }

        Event event;
        event.sid = std::move(sid_text);
        event.type = string_field(root, "event");
        event.payload = decode_payload(event.type, root);

        result.status = DecodeResult::Status::ok;
        result.event = std::move(event);
        return result;
    }

  private:
    std::unique_ptr<Json::CharReader> reader_;

    static std::string string_field(const Json::Value& obj, const char* key) {
        const Json::Value& value = obj[key];
        return value.isString() ? value.asString() : std::string();
    }

    static int int_field(const Json::Value& obj, const char* key) {
        const Json::Value& value = obj[key];
        // 超出 int 范围按类型不符处理
        if (value.isNumeric() && value.isConvertibleTo(Json::intValue)) return value.asInt();
        return 0;
    }

    static std::optional<Epoch> epoch_field(const Json::Value& obj, const char* key) {
        const Json::Value& value = obj[key];
        if (! value.isString()) return std::nullopt;
        return parse_epoch(value.asString());
    }

    static std::vector<std::string> string_list_field(const Json::Value& obj, const char* key) {
        std::vector<std::string> list;
        const Json::Value& value = obj[key];
        if (! value.isArray()) return list;

        list.reserve(value.size());
        for (const auto& item : value) {
            if (item.isString()) {
                list.push_back(item.asString());
            } else if (item.isConvertibleTo(Json::stringValue)) {
                list.push_back(item.asString());
            } else {
                list.push_back(Json::writeString(Json::StreamWriterBuilder(), item));
            }
        }
        return list;
    }

    static RegionMarker region_marker(const Json::Value& obj) {
        RegionMarker marker;
        marker.time = epoch_field(obj, "time");
        marker.nesting = int_field(obj, "nesting");
        marker.category = string_field(obj, "category");
        marker.label = string_field(obj, "label");
        return marker;
    }

    static EventPayload decode_payload(std::string_view type, const Json::Value& obj) {
        if (type == "version") {
            return VersionEvent{string_field(obj, "exe")};
        } else if (type == "start") {
            return StartEvent{epoch_field(obj, "time"), string_list_field(obj, "argv")};
        } else if (type == "cmd_name") {
            CmdNameEvent cmd_name;
            cmd_name.name = string_field(obj, "name");
            if (obj["hierarchy"].isString()) {
                cmd_name.hierarchy = detail::split(obj["hierarchy"].asString(), HIERARCHY_SEPARATOR);
            }
            return cmd_name;
        } else if (type == "def_repo") {
            return DefRepoEvent{string_field(obj, "worktree")};
        } else if (type == "exit") {
            return ExitEvent{epoch_field(obj, "time"), int_field(obj, "code")};
        } else if (type == "atexit") {
            return AtExitEvent{};
        } else if (type == "signal") {
            return SignalEvent{epoch_field(obj, "time"), int_field(obj, "signo")};
        } else if (type == "error") {
            return ErrorEvent{string_field(obj, "msg")};
        } else if (type == "data" || type == "data_json") {
            return DataEvent{};
        } else if (type == "child_start") {
            return ChildStartEvent{};
        } else if (type == "child_exit") {
            return ChildExitEvent{};
        } else if (type == "exec") {
            return ExecEvent{};
        } else if (type == "cmd_mode") {
            return CmdModeEvent{string_field(obj, "name")};
        } else if (type == "alias") {
            return AliasEvent{string_field(obj, "alias"), string_list_field(obj, "argv")};
        } else if (type == "region_enter") {
            return RegionEnterEvent{region_marker(obj)};
        } else if (type == "region_leave") {
            return RegionLeaveEvent{region_marker(obj)};
        }
        return UnknownEvent{};
    }
};

// 🔥 ===== 记录 =====
struct InvocationRecord {
    std::string sid;

    std::optional<std::string> version;
    std::optional<Epoch> start_epoch;
    std::optional<std::vector<std::string>> argv;
    std::optional<std::string> cmd_name;
    std::optional<std::vector<std::string>> hierarchy;
    std::optional<std::string> worktree;
    std::optional<Epoch> exit_epoch;
    std::optional<int> exit_code;
    std::optional<Epoch> signal_epoch;
    std::optional<int> signal_signo;
    std::vector<std::string> cmd_modes;
    std::optional<std::string> alias;
    std::optional<std::vector<std::string>> alias_argv;

    // 对账阶段填充
    std::optional<int64_t> duration;
    std::optional<std::string> final_hierarchy;

    explicit InvocationRecord(std::string sid = {}) : sid(std::move(sid)) {}

    bool empty() const {
        return ! version && ! start_epoch && ! argv && ! cmd_name && ! hierarchy && ! worktree && ! exit_epoch &&
               ! exit_code && ! signal_epoch && ! signal_signo && cmd_modes.empty() && ! alias && ! alias_argv;
    }

    bool is_complete() const {
        return final_hierarchy.has_value() && duration.has_value();
    }
};

struct RegionRecord {
    std::string sid;   // 所属 invocation
    std::string label; // "REGION:" + 转义后的 category/label
    std::vector<Epoch> enter_epochs;
    std::vector<Epoch> leave_epochs;
    size_t enter_count = 0;
    size_t leave_count = 0;

    std::optional<int64_t> duration;
    std::optional<std::string> parent_hierarchy;

    // 最终路径只能从父 invocation 推导
    std::optional<std::string> final_hierarchy() const {
        if (! parent_hierarchy) return std::nullopt;
        return *parent_hierarchy + HIERARCHY_SEPARATOR + label;
    }

    bool is_complete() const {
        return parent_hierarchy.has_value() && duration.has_value();
    }
};

struct RegionKey {
    std::string sid;
    std::string label;

    struct Hasher {
        size_t operator()(const RegionKey& key) const noexcept {
            size_t h1 = std::hash<std::string>{}(key.sid);
            size_t h2 = std::hash<std::string>{}(key.label);
            return h1 ^ (h2 + 0x9e3779b9 + (h1 << 6) + (h1 >> 2));
        }
    };

    bool operator==(const RegionKey& other) const noexcept {
        return sid == other.sid && label == other.label;
    }

    std::string to_string() const {
        return sid + HIERARCHY_SEPARATOR + label;
    }
};

namespace detail {
inline Json::Value string_array(const std::vector<std::string>& items) {
    Json::Value array(Json::arrayValue);
    for (const auto& item : items) {
        array.append(item);
    }
    return array;
}

inline Json::Value epoch_array(const std::vector<Epoch>& epochs) {
    Json::Value array(Json::arrayValue);
    for (Epoch epoch : epochs) {
        array.append(epoch);
    }
    return array;
}
} // namespace detail

inline Json::Value to_json(const InvocationRecord& record) {
    Json::Value value(Json::objectValue);
    value["sid"] = record.sid;
    if (record.version) value["version"] = *record.version;
    if (record.start_epoch) value["start_epoch"] = *record.start_epoch;
    if (record.argv) value["argv"] = detail::string_array(*record.argv);
    if (record.cmd_name) value["cmd_name"] = *record.cmd_name;
    if (record.hierarchy) value["hierarchy"] = detail::join(*record.hierarchy, HIERARCHY_SEPARATOR);
    if (record.worktree) value["worktree"] = *record.worktree;
    if (record.exit_epoch) value["exit_epoch"] = *record.exit_epoch;
    if (record.exit_code) value["exit_code"] = *record.exit_code;
    if (record.signal_epoch) value["signal_epoch"] = *record.signal_epoch;
    if (record.signal_signo) value["signal_signo"] = *record.signal_signo;
    if (! record.cmd_modes.empty()) value["cmd_mode"] = detail::string_array(record.cmd_modes);
    if (record.alias) value["alias"] = *record.alias;
    if (record.alias_argv) value["alias_argv"] = detail::string_array(*record.alias_argv);
    if (record.duration) value["duration"] = static_cast<Json::Int64>(*record.duration);
    if (record.final_hierarchy) value["final_hierarchy"] = *record.final_hierarchy;
    return value;
}

inline Json::Value to_json(const RegionRecord& record) {
    Json::Value value(Json::objectValue);
    value["sid"] = record.sid;
    value["label"] = record.label;
    value["enter_epochs"] = detail::epoch_array(record.enter_epochs);
    value["leave_epochs"] = detail::epoch_array(record.leave_epochs);
    value["region_enter_count"] = static_cast<Json::UInt64>(record.enter_count);
    value["region_leave_count"] = static_cast<Json::UInt64>(record.leave_count);
    if (record.duration) value["duration"] = static_cast<Json::Int64>(*record.duration);
    if (auto hierarchy = record.final_hierarchy()) value["final_hierarchy"] = *hierarchy;
    return value;
}

// 🔥 ===== worktree 规范化 =====
class WorktreeResolver {
  public:
    using ResolveFunc = std::function<std::optional<std::string>(const std::string&)>;

    WorktreeResolver() : resolve_(&WorktreeResolver::canonical_path) {}

    explicit WorktreeResolver(ResolveFunc resolve) : resolve_(std::move(resolve)) {}

    // 目录可能已经被删掉了, 此时原样返回
    const std::string& resolve(const std::string& worktree) {
        auto it = cache_.find(worktree);
        if (it != cache_.end()) {
            return it->second;
        }

        std::optional<std::string> resolved = resolve_(worktree);
        return cache_.emplace(worktree, resolved ? *resolved : worktree).first->second;
    }

    size_t cached() const {
        return cache_.size();
    }

    static std::optional<std::string> canonical_path(const std::string& path) {
        std::error_code ec;
        std::filesystem::path canonical = std::filesystem::canonical(path, ec);
        if (ec) {
            return std::nullopt;
        }
        return canonical.string();
    }

  private:
    ResolveFunc resolve_;
    std::unordered_map<std::string, std::string> cache_;
};

/**
 * @brief 一次运行的全部可变状态
 *
 * 由 Tr2Collapser 持有, 运行结束时随之析构.
 */
struct SessionContext {
    using InvocationMap = std::unordered_map<std::string, InvocationRecord>;
    using RegionMap = std::unordered_map<RegionKey, RegionRecord, RegionKey::Hasher>;

    InvocationMap invocations;
    RegionMap regions;
    WorktreeResolver worktrees;

    SessionContext() = default;

    explicit SessionContext(WorktreeResolver resolver) : worktrees(std::move(resolver)) {}

    InvocationRecord& invocation(const std::string& sid) {
        auto it = invocations.find(sid);
        if (it == invocations.end()) {
            it = invocations.emplace(sid, InvocationRecord(sid)).first;
        }
        return it->second;
    }

    const InvocationRecord* find_invocation(const std::string& sid) const {
        auto it = invocations.find(sid);
        return it == invocations.end() ? nullptr : &it->second;
    }

    const RegionRecord* find_region(const std::string& sid, const std::string& label) const {
        auto it = regions.find(RegionKey{sid, label});
        return it == regions.end() ? nullptr : &it->second;
    }
};

// 🔥 ===== region 合成 =====
class RegionSynthesizer {
  public:
    explicit RegionSynthesizer(SessionContext& ctx) : ctx_(ctx) {}

    // region 不是独立进程, 但要当作一层栈帧; '/' 已被 git 用作层级分隔, 必须转义
    static std::string synthetic_label(std::string_view category, std::string_view label) {
        std::string raw;
        raw.reserve(category.size() + label.size() + 1);
        raw.append(category);
        raw += HIERARCHY_SEPARATOR;
        raw.append(label);
        return std::string(REGION_PREFIX) + detail::replace_char(raw, HIERARCHY_SEPARATOR, LABEL_PLACEHOLDER);
    }

    void enter(const std::string& sid, const RegionMarker& marker) {
        if (! marker.time) {
            log::logger()->debug("region_enter without time for sid {}, ignored", sid);
            return;
        }
        RegionRecord& region = lookup(sid, marker);
        region.enter_count++;
        region.enter_epochs.push_back(*marker.time);
    }

    void leave(const std::string& sid, const RegionMarker& marker) {
        if (! marker.time) {
            log::logger()->debug("region_leave without time for sid {}, ignored", sid);
            return;
        }
        RegionRecord& region = lookup(sid, marker);
        region.leave_count++;
        region.leave_epochs.push_back(*marker.time);
    }

  private:
    SessionContext& ctx_;

    RegionRecord& lookup(const std::string& sid, const RegionMarker& marker) {
        RegionKey key{sid, synthetic_label(marker.category, marker.label)};
        auto it = ctx_.regions.find(key);
        if (it == ctx_.regions.end()) {
            RegionRecord region;
            region.sid = sid;
            region.label = key.label;
            it = ctx_.regions.emplace(std::move(key), std::move(region)).first;
        }
        return it->second;
    }
};

// 🔥 ===== 状态机 =====
class SessionEventStore {
  public:
    explicit SessionEventStore(SessionContext& ctx) : ctx_(ctx), regions_(ctx) {}

    /**
     * @brief 把一个事件折叠进对应 sid 的记录
     *
     * @return 事件类型是否被识别; 已知但被忽略的类型也算识别
     */
    bool apply(const Event& event) {
        InvocationRecord& record = ctx_.invocation(event.sid);
        return std::visit([&](const auto& payload) { return this->on(event, record, payload); }, event.payload);
    }

  private:
    SessionContext& ctx_;
    RegionSynthesizer regions_;

    bool on(const Event& event, InvocationRecord& record, const VersionEvent& version) {
        // version 应当是该 sid 的第一个事件
        if (! record.empty()) {
            throw ConsistencyException("Have event " + event.sid + " twice! <" + pretty_json(to_json(record)) + ">");
        }
        record.version = version.exe;
        return true;
    }

    bool on(const Event&, InvocationRecord& record, const StartEvent& start) {
        if (start.time) record.start_epoch = *start.time;
        record.argv = start.argv;
        return true;
    }

    bool on(const Event&, InvocationRecord& record, const CmdNameEvent& cmd_name) {
        record.cmd_name = cmd_name.name;
        if (cmd_name.hierarchy) record.hierarchy = *cmd_name.hierarchy;
        return true;
    }

    bool on(const Event&, InvocationRecord& record, const DefRepoEvent& def_repo) {
        record.worktree = ctx_.worktrees.resolve(def_repo.worktree);
        return true;
    }

    bool on(const Event&, InvocationRecord& record, const ExitEvent& exit) {
        if (exit.time) record.exit_epoch = *exit.time;
        record.exit_code = exit.code;
        return true;
    }

    // exit 之后才到, 需要的信息 exit 里都有
    bool on(const Event&, InvocationRecord&, const AtExitEvent&) {
        return true;
    }

    bool on(const Event&, InvocationRecord& record, const SignalEvent& signal) {
        if (signal.time) record.signal_epoch = *signal.time;
        record.signal_signo = signal.signo;
        return true;
    }

    bool on(const Event&, InvocationRecord&, const ErrorEvent&) {
        return true;
    }

    // 没有明确的聚合目标
    bool on(const Event&, InvocationRecord&, const DataEvent&) {
        return true;
    }

    // 子进程有自己的 sid, 不在这里建模成栈帧
    bool on(const Event&, InvocationRecord&, const ChildStartEvent&) {
        return true;
    }

    bool on(const Event&, InvocationRecord&, const ChildExitEvent&) {
        return true;
    }

    bool on(const Event&, InvocationRecord&, const ExecEvent&) {
        return true;
    }

    bool on(const Event&, InvocationRecord& record, const CmdModeEvent& cmd_mode) {
        record.cmd_modes.push_back(cmd_mode.name);
        return true;
    }

    bool on(const Event&, InvocationRecord& record, const AliasEvent& alias) {
        record.alias = alias.alias;
        record.alias_argv = alias.argv;
        return true;
    }

    bool on(const Event& event, InvocationRecord&, const RegionEnterEvent& enter) {
        regions_.enter(event.sid, enter);
        return true;
    }

    bool on(const Event& event, InvocationRecord&, const RegionLeaveEvent& leave) {
        regions_.leave(event.sid, leave);
        return true;
    }

    bool on(const Event&, InvocationRecord&, const UnknownEvent&) {
        return false;
    }
};

// 🔥 ===== 对账 =====
class Reconciler {
  public:
    void run(SessionContext& ctx) const {
        finalize_regions(ctx);
        patch_invocations(ctx);
    }

    // A: 把 region 的 enter/leave 配对成时长, 挂到父 invocation 的路径下
    void finalize_regions(SessionContext& ctx) const {
        for (auto it = ctx.regions.begin(); it != ctx.regions.end();) {
            RegionRecord& region = it->second;

            // 进程中途退出时 region_leave 会缺失
            if (region.leave_epochs.empty() || region.leave_epochs.size() < region.enter_epochs.size()) {
                log::logger()->debug("dropping region {}: {} enter vs {} leave", it->first.to_string(),
                                     region.enter_epochs.size(), region.leave_epochs.size());
                it = ctx.regions.erase(it);
                continue;
            }
            if (region.leave_epochs.size() > region.enter_epochs.size()) {
                throw ConsistencyException("More region_leave than region_enter events for " + it->first.to_string() +
                                           " <" + pretty_json(to_json(region)) + ">");
            }

            // 按排序后的位置配对, 与到达顺序无关
            std::sort(region.enter_epochs.begin(), region.enter_epochs.end());
            std::sort(region.leave_epochs.begin(), region.leave_epochs.end());
            int64_t total = 0;
            for (size_t i = 0; i < region.enter_epochs.size(); ++i) {
                total += scaled_duration(region.enter_epochs[i], region.leave_epochs[i]);
            }
            region.duration = total;

            const InvocationRecord* parent = ctx.find_invocation(region.sid);
            if (parent != nullptr && parent->hierarchy) {
                region.parent_hierarchy = detail::join(*parent->hierarchy, HIERARCHY_SEPARATOR);
            } else {
                log::logger()->debug("region {} has no parent hierarchy", it->first.to_string());
            }
            ++it;
        }
    }

    // B: 补齐非正常退出或乱序导致缺失的字段
    void patch_invocations(SessionContext& ctx) const {
        for (auto& [sid, record] : ctx.invocations) {
            if (record.is_complete()) continue;

            if (! record.exit_code && record.signal_signo) {
                log::logger()->debug("sid {} died on signal {}, using it as exit", sid, *record.signal_signo);
                record.exit_epoch = record.signal_epoch;
                record.exit_code = record.signal_signo;
            }

            if (! record.duration && record.start_epoch && record.exit_epoch) {
                record.duration = scaled_duration(*record.start_epoch, *record.exit_epoch);
            }

            if (! record.final_hierarchy) {
                if (record.hierarchy) {
                    record.final_hierarchy = detail::join(*record.hierarchy, HIERARCHY_SEPARATOR);
                } else if (record.exit_code && *record.exit_code != 0) {
                    // i.e. 裸跑 "git" 出错时从来没有 cmd_name
                    record.final_hierarchy = std::string(ERROR_HIERARCHY);
                }
            }

            if (! record.is_complete()) {
                log::logger()->debug("sid {} is incomplete and will not be folded", sid);
            }
        }
    }
};

// 🔥 ===== 堆栈折叠器 =====
struct FoldedStacks {
    std::unordered_map<std::string, int64_t> stacks;

    bool empty() const {
        return stacks.empty();
    }

    size_t size() const {
        return stacks.size();
    }

    int64_t at(const std::string& key) const {
        auto it = stacks.find(key);
        return it == stacks.end() ? 0 : it->second;
    }
};

class StackFolder {
  public:
    // 求和满足交换律, 遍历顺序不影响结果
    FoldedStacks fold(const SessionContext& ctx) const {
        FoldedStacks folded;

        for (const auto& [sid, record] : ctx.invocations) {
            if (! record.is_complete()) continue;
            folded.stacks[stack_key(*record.final_hierarchy)] += *record.duration;
        }

        for (const auto& [key, region] : ctx.regions) {
            if (! region.is_complete()) continue;
            folded.stacks[stack_key(*region.final_hierarchy())] += *region.duration;
        }

        return folded;
    }

    static std::string stack_key(std::string_view hierarchy) {
        return detail::replace_char(hierarchy, HIERARCHY_SEPARATOR, JOIN_MARKER);
    }
};

struct FoldedWriteOptions {
    std::string frame_separator = "/";
};

class FoldedWriter {
  public:
    void write(const FoldedStacks& folded, std::ostream& os, const FoldedWriteOptions& options = {}) const {
        std::vector<std::pair<std::string_view, int64_t>> sorted;
        sorted.reserve(folded.stacks.size());
        for (const auto& [key, duration] : folded.stacks) {
            sorted.emplace_back(key, duration);
        }
        std::sort(sorted.begin(), sorted.end(),
                  [](const auto& a, const auto& b) { return a.first < b.first; });

        for (const auto& [key, duration] : sorted) {
            os << render_path(key, options.frame_separator) << ' ' << duration << '\n';
        }
    }

    static std::string render_path(std::string_view key, std::string_view frame_separator) {
        std::string path;
        path.reserve(key.size());
        for (char c : key) {
            if (c == JOIN_MARKER) {
                path.append(frame_separator);
            } else if (c == LABEL_PLACEHOLDER) {
                path += HIERARCHY_SEPARATOR;
            } else {
                path += c;
            }
        }
        return path;
    }
};

/**
 * @brief 原样导出折叠前的记录, 方便手工检查或自定义聚合
 *
 * 格式不稳定, 不保证兼容.
 */
class RawDumper {
  public:
    Json::Value to_json(const SessionContext& ctx) const {
        Json::Value root(Json::objectValue);
        for (const auto& [sid, record] : ctx.invocations) {
            root[sid] = tr2collapse::to_json(record);
        }
        for (const auto& [key, region] : ctx.regions) {
            root[key.to_string()] = tr2collapse::to_json(region);
        }
        return root;
    }

    void write(const SessionContext& ctx, std::ostream& os) const {
        os << pretty_json(to_json(ctx)) << '\n';
    }
};

// 🔥 ===== 配置 =====
struct CollapseConfig {
    int debug_level = 0;
    bool dump_raw = false;
    std::string frame_separator = "/";
    std::vector<std::string> inputs; // 为空或 "-" 时读 stdin

    void validate() const {
        if (debug_level < 0) {
            throw ConfigException("Debug level cannot be negative");
        }
        if (frame_separator.empty()) {
            throw ConfigException("Frame separator cannot be empty");
        }
        if (frame_separator.find_first_of(" \n") != std::string::npos) {
            throw ConfigException("Frame separator cannot contain spaces or newlines");
        }
    }
};

// 🔥 ===== 主入口类 =====
class Tr2Collapser {
  private:
    CollapseConfig config_;
    SessionContext ctx_;
    LineDecoder decoder_;
    SessionEventStore store_;
    Reconciler reconciler_;
    bool finished_ = false;
    size_t line_count_ = 0;
    size_t skipped_lines_ = 0;

  public:
    explicit Tr2Collapser(const CollapseConfig& config = {}) : config_(config), store_(ctx_) {
        config_.validate();
    }

    Tr2Collapser(const CollapseConfig& config, WorktreeResolver resolver)
        : config_(config), ctx_(std::move(resolver)), store_(ctx_) {
        config_.validate();
    }

    Tr2Collapser(const Tr2Collapser&) = delete;
    Tr2Collapser& operator=(const Tr2Collapser&) = delete;

    void consume_line(std::string_view line) {
        if (finished_) {
            throw Tr2CollapseException("Cannot consume input after reconciliation");
        }
        ++line_count_;

        DecodeResult result = decoder_.decode(line);
        switch (result.status) {
            case DecodeResult::Status::skip:
                ++skipped_lines_;
                log::logger()->debug("line {}: skipped, {}", line_count_, detail::trim(result.reason));
                return;
            case DecodeResult::Status::fatal:
                throw FatalEventException("No sid in <" + std::string(line) + "> <" + pretty_json(result.decoded) +
                                          ">");
            case DecodeResult::Status::ok:
                break;
        }

        bool handled = false;
        try {
            handled = store_.apply(*result.event);
        } catch (const ConsistencyException&) {
            log::logger()->error("line {}: {}", line_count_, line);
            throw;
        }

        if ((config_.debug_level > 1 && ! handled) || config_.debug_level > 2) {
            log::logger()->info("{}", line);
            log::logger()->info("{}", pretty_json(result.decoded));
        }
    }

    void consume_stream(std::istream& in) {
        std::string line;
        while (std::getline(in, line)) {
            if (! line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            consume_line(line);
        }
    }

    void consume_buffer(std::string_view buffer) {
        detail::LineScanner scanner(buffer);
        while (true) {
            std::string_view line = scanner.next_trimmed_line();
            if (line.empty() && scanner.eof()) break;
            consume_line(line);
        }
    }

    void consume_file(const std::string& filename) {
        detail::MMapBuffer buffer(filename);
        consume_buffer(buffer.view());
    }

    // 两遍对账只跑一次
    void finish() {
        if (finished_) return;
        reconciler_.run(ctx_);
        finished_ = true;
    }

    FoldedStacks fold() {
        finish();
        return StackFolder{}.fold(ctx_);
    }

    void write_output(std::ostream& out) {
        finish();
        if (config_.dump_raw) {
            RawDumper{}.write(ctx_, out);
            return;
        }
        FoldedWriteOptions options;
        options.frame_separator = config_.frame_separator;
        FoldedWriter{}.write(fold(), out, options);
    }

    const SessionContext& context() const {
        return ctx_;
    }

    const CollapseConfig& config() const {
        return config_;
    }

    size_t line_count() const {
        return line_count_;
    }

    size_t skipped_lines() const {
        return skipped_lines_;
    }

    static void run(const CollapseConfig& config, std::istream& in, std::ostream& out) {
        Tr2Collapser collapser(config);
        if (config.inputs.empty()) {
            collapser.consume_stream(in);
        }
        for (const auto& input : config.inputs) {
            if (input == "-") {
                collapser.consume_stream(in);
            } else {
                collapser.consume_file(input);
            }
        }
        collapser.write_output(out);
    }
};

} // namespace tr2collapse
