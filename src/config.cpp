#include "config.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

filesystem::path WORK_DIR = filesystem::temp_directory_path() / "grader";
bool DEBUG = false;

void from_json(const json &j, execution_limits &limits) {
    assign_optional(j, limits.time_limit, "time_limit");
    assign_optional(j, limits.memory_limit, "memory_limit");
    assign_optional(j, limits.output_limit, "output_limit");
    assign_optional(j, limits.file_limit, "file_limit");
    assign_optional(j, limits.process_limit, "process_limit");
}

void to_json(json &j, const execution_limits &limits) {
    j = {{"time_limit", limits.time_limit},
         {"memory_limit", limits.memory_limit},
         {"output_limit", limits.output_limit},
         {"file_limit", limits.file_limit},
         {"process_limit", limits.process_limit}};
}

void from_json(const json &j, sandbox_options &options) {
    assign_optional(j, options.container_binary, "container_binary");
    assign_optional(j, options.slots, "slots");
    assign_optional(j, options.disable_network, "disable_network");
    assign_optional(j, options.container_pids_limit, "container_pids_limit");
    assign_optional(j, options.force_local, "force_local");
    if (exists(j, "images"))
        for (auto &[lang, image] : j.at("images").items())
            options.images[lang] = image.get<string>();
    if (exists(j, "limits"))
        j.at("limits").get_to(options.limits);
}

void from_json(const json &j, composite_weights &weights) {
    assign_optional(j, weights.correctness, "correctness");
    assign_optional(j, weights.quality, "quality");
    assign_optional(j, weights.style, "style");
    assign_optional(j, weights.performance, "performance");
    assign_optional(j, weights.naming, "naming");
    assign_optional(j, weights.coding, "coding");
    assign_optional(j, weights.mcq, "mcq");
}

void from_json(const json &j, orchestrator_options &options) {
    assign_optional(j, options.workers, "workers");
    assign_optional(j, options.fail_on_total_timeout, "fail_on_total_timeout");
}

void from_json(const json &j, grader_config &config) {
    if (exists(j, "sandbox")) j.at("sandbox").get_to(config.sandbox);
    if (exists(j, "weights")) j.at("weights").get_to(config.weights);
    if (exists(j, "orchestrator")) j.at("orchestrator").get_to(config.orchestrator);
}

grader_config load_config(const filesystem::path &path) {
    string content;
    try {
        content = read_file_content(path);
    } catch (std::system_error &ex) {
        throw invalid_argument_error(fmt::format("Unable to open config file {}: {}", path, ex.what()));
    }

    grader_config config;
    try {
        json j = json::parse(content);
        j.get_to(config);
        if (exists(j, "work_dir")) WORK_DIR = j.at("work_dir").get<string>();
        assign_optional(j, DEBUG, "debug");
    } catch (std::exception &ex) {
        throw invalid_argument_error(fmt::format("Malformed config file {}: {}", path, ex.what()));
    }
    return config;
}

template <typename T>
static void override_from_env(const char *key, T &value) {
    string text = get_env(key, "");
    if (text.empty()) return;
    try {
        value = boost::lexical_cast<T>(text);
    } catch (boost::bad_lexical_cast &) {
        LOG(WARNING) << "Ignoring malformed environment variable " << key << "=" << text;
    }
}

template <>
void override_from_env(const char *key, bool &value) {
    string text = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(get_env(key, "")));
    if (text.empty()) return;
    if (text == "1" || text == "true" || text == "yes" || text == "on")
        value = true;
    else if (text == "0" || text == "false" || text == "no" || text == "off")
        value = false;
    else
        LOG(WARNING) << "Ignoring malformed environment variable " << key << "=" << text;
}

void apply_env_overrides(grader_config &config) {
    string work_dir = get_env("GRADER_WORK_DIR", "");
    if (!work_dir.empty()) WORK_DIR = work_dir;
    override_from_env("GRADER_WORKERS", config.orchestrator.workers);
    override_from_env("GRADER_SANDBOX_SLOTS", config.sandbox.slots);
    override_from_env("GRADER_CONTAINER_BINARY", config.sandbox.container_binary);
    override_from_env("GRADER_DEBUG", DEBUG);
}

}  // namespace grader
