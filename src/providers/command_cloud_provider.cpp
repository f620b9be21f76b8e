#include "command_cloud_provider.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <regex>

CommandCloudProvider::CommandCloudProvider(CloudConfig config) : config_(std::move(config)) {}

CommandResult CommandCloudProvider::run(const std::string& what, const std::string& command) {
    log_debug("cloud {}: {}", what, command);
    auto result = platform::run_shell(command, config_.command_timeout);
    if (result.failed()) {
        log_debug("cloud {} exited {}: {}", what, result.exit_code, result.stderr_data);
    }
    return result;
}

static std::string describe_failure(const CommandResult& r) {
    std::string msg = r.stderr_data.empty() ? r.stdout_data : r.stderr_data;
    trim(msg);
    if (r.exit_code == -1 && msg.empty()) return "command could not run or timed out";
    return fmt::format("exit {}: {}", r.exit_code, msg);
}

Result<std::string> CommandCloudProvider::launch_instance(const LaunchParams& params) {
    if (config_.launch.empty()) {
        return Result<std::string>::Err("no `launch` command configured");
    }

    std::filesystem::path userdata_file;
    if (!params.spec.image_userdata.empty()) {
        userdata_file = platform::write_temp_file("cumulus_userdata", params.spec.image_userdata);
        if (userdata_file.empty()) {
            return Result<std::string>::Err("could not write userdata to a temporary file");
        }
    }

    std::string command;
    try {
        command = fmt::format(fmt::runtime(config_.launch),
                              fmt::arg("instance_id", ""),
                              fmt::arg("image_id", params.spec.image_id),
                              fmt::arg("flavor", params.spec.flavor),
                              fmt::arg("key_name", params.key_name),
                              fmt::arg("public_key", params.public_key),
                              fmt::arg("security_group", params.spec.security_group),
                              fmt::arg("image_user", params.spec.image_user),
                              fmt::arg("node_name", params.node_name),
                              fmt::arg("userdata_file", userdata_file.string()));
    } catch (const fmt::format_error& e) {
        std::error_code ec;
        if (!userdata_file.empty()) std::filesystem::remove(userdata_file, ec);
        return Result<std::string>::Err(std::string("bad `launch` template: ") + e.what());
    }

    auto r = run("launch", command);
    if (!userdata_file.empty()) {
        std::error_code ec;
        std::filesystem::remove(userdata_file, ec);
    }

    if (r.failed()) return Result<std::string>::Err(describe_failure(r));

    auto lines = split_lines(r.stdout_data);
    if (lines.empty()) {
        return Result<std::string>::Err("`launch` command printed no instance id");
    }
    return Result<std::string>::Ok(lines.front());
}

static Result<std::string> expand_for_instance(const std::string& tmpl, const char* what,
                                               const std::string& instance_id) {
    if (tmpl.empty()) {
        return Result<std::string>::Err(fmt::format("no `{}` command configured", what));
    }
    try {
        return Result<std::string>::Ok(
            fmt::format(fmt::runtime(tmpl), fmt::arg("instance_id", instance_id)));
    } catch (const fmt::format_error& e) {
        return Result<std::string>::Err(fmt::format("bad `{}` template: {}", what, e.what()));
    }
}

static bool mentions_not_found(const CommandResult& r) {
    std::string text = r.stdout_data + " " + r.stderr_data;
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return text.find("not found") != std::string::npos ||
           text.find("no such") != std::string::npos;
}

Result<void> CommandCloudProvider::terminate_instance(const std::string& instance_id) {
    auto cmd = expand_for_instance(config_.terminate, "terminate", instance_id);
    if (cmd.is_err()) return Result<void>::Err(cmd.error);

    auto r = run("terminate", cmd.value);
    if (r.success()) return Result<void>::Ok();

    if (r.exit_code != -1 && mentions_not_found(r)) {
        log_info("Instance {} is already gone", instance_id);
        return Result<void>::Ok();
    }
    return Result<void>::Err(describe_failure(r));
}

Result<bool> CommandCloudProvider::is_running(const std::string& instance_id) {
    auto cmd = expand_for_instance(config_.status, "status", instance_id);
    if (cmd.is_err()) return Result<bool>::Err(cmd.error);

    auto r = run("status", cmd.value);
    if (r.failed()) return Result<bool>::Err(describe_failure(r));

    std::string state = r.stdout_data;
    trim(state);
    std::string want = config_.running_state;
    auto lower = [](std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return s;
    };
    return Result<bool>::Ok(lower(state) == lower(want));
}

Result<std::vector<std::string>> CommandCloudProvider::list_addresses(const std::string& instance_id) {
    using R = Result<std::vector<std::string>>;
    auto cmd = expand_for_instance(config_.addresses, "addresses", instance_id);
    if (cmd.is_err()) return R::Err(cmd.error);

    auto r = run("addresses", cmd.value);
    if (r.failed()) return R::Err(describe_failure(r));
    return R::Ok(extract_ipv4_addresses(r.stdout_data));
}

std::vector<std::string> extract_ipv4_addresses(const std::string& text) {
    static const std::regex ipv4_re(
        R"(\b((25[0-5]|2[0-4][0-9]|1[0-9]{2}|[1-9]?[0-9])\.){3}(25[0-5]|2[0-4][0-9]|1[0-9]{2}|[1-9]?[0-9])\b)");

    std::vector<std::string> out;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), ipv4_re);
         it != std::sregex_iterator(); ++it) {
        std::string ip = it->str();
        if (std::find(out.begin(), out.end(), ip) == out.end()) out.push_back(ip);
    }
    return out;
}
