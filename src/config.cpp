#include "vigil/config.hpp"

#include <memory>
#include <utility>

#include "simdjson.h"

#include "lcr/log/logger.hpp"
#include "vigil/config/helpers.hpp"
#include "vigil/supervisor.hpp"
#include "vigil/timed_check.hpp"


namespace vigil::config {

namespace {

[[nodiscard]]
Status fail(std::string detail) {
    VG_ERROR("[CONFIG] " << detail);
    return Status::invalid_configuration(std::move(detail));
}

[[nodiscard]]
Status parse_check(const simdjson::dom::element& entry, std::size_t index, Check& out) {
    const std::string where = "checks[" + std::to_string(index) + "]";

    if (!helper::is_object(entry)) {
        return fail(where + " must be an object");
    }
    std::string_view name;
    if (!helper::parse_string_required(entry, "name", name)) {
        return fail(where + ".name is missing or not a string");
    }
    if (name.empty()) {
        return fail(where + ".name must not be empty");
    }
    std::uint64_t timeout_ms = 0;
    if (!helper::parse_uint64_required(entry, "timeout_ms", timeout_ms)) {
        return fail(where + ".timeout_ms is missing or not an unsigned integer");
    }
    if (timeout_ms > static_cast<std::uint64_t>(MAX_TIMEOUT.count())) {
        return fail(where + ".timeout_ms exceeds " + std::to_string(MAX_TIMEOUT.count()) + " ms");
    }
    out.name = std::string(name);
    out.timeout = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(timeout_ms));
    return Status::success();
}

[[nodiscard]]
Status parse_root(const simdjson::dom::element& root, Config& out) {
    if (!helper::is_object(root)) {
        return fail("root must be a JSON object");
    }

    bool present = false;
    std::uint64_t period_ms = 0;
    if (!helper::parse_uint64_optional(root, "period_ms", period_ms, present)) {
        return fail("period_ms must be an unsigned integer");
    }
    if (present && period_ms > static_cast<std::uint64_t>(MAX_PERIOD.count())) {
        return fail("period_ms exceeds " + std::to_string(MAX_PERIOD.count()) + " ms");
    }
    if (present) {
        out.period = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(period_ms));
    }

    std::string_view level;
    if (!helper::parse_string_optional(root, "log_level", level, present)) {
        return fail("log_level must be a string");
    }
    if (present) {
        lcr::log::Level parsed = lcr::log::Level::Info;
        if (!lcr::log::parse_level(level, parsed)) {
            return fail("log_level '" + std::string(level) + "' is not one of trace|debug|info|warn|error|fatal");
        }
        out.log_level = std::string(level);
    }

    simdjson::dom::array checks;
    if (!helper::parse_array_required(root, "checks", checks)) {
        return fail("checks is missing or not an array");
    }
    std::size_t index = 0;
    for (simdjson::dom::element entry : checks) {
        Check check;
        Status s = parse_check(entry, index++, check);
        if (!s.ok()) {
            return s;
        }
        out.checks.push_back(std::move(check));
    }
    return Status::success();
}

} // namespace


Status parse(std::string_view json, Config& out) {
    simdjson::dom::parser parser;
    simdjson::dom::element root;
    auto error = parser.parse(json.data(), json.size()).get(root);
    if (error) {
        return fail(std::string("malformed JSON: ") + simdjson::error_message(error));
    }
    Config cfg;
    Status s = parse_root(root, cfg);
    if (!s.ok()) {
        return s;
    }
    out = std::move(cfg);
    return Status::success();
}

Status load(const std::string& path, Config& out) {
    simdjson::padded_string json;
    auto error = simdjson::padded_string::load(path).get(json);
    if (error) {
        return fail("cannot read '" + path + "': " + simdjson::error_message(error));
    }
    VG_DEBUG("[CONFIG] Loaded " << json.size() << " byte(s) from '" << path << "'.");
    return parse(std::string_view(json.data(), json.size()), out);
}

Status apply(const Config& cfg, Supervisor& supervisor) {
    // Build everything first so a bad entry leaves the supervisor untouched
    std::vector<std::unique_ptr<TimedCheck>> built;
    built.reserve(cfg.checks.size());
    for (const auto& entry : cfg.checks) {
        std::unique_ptr<TimedCheck> check;
        Status s = TimedCheck::create(entry.name, entry.timeout, check);
        if (!s.ok()) {
            return s;
        }
        built.push_back(std::move(check));
    }
    for (auto& check : built) {
        supervisor.add(std::move(check));
    }
    VG_INFO("[CONFIG] Registered " << built.size() << " liveness check(s).");
    return Status::success();
}

} // namespace vigil::config
