#include "rg/state_store.hpp"

#include <filesystem>

#include <yaml-cpp/yaml.h>

#include "rg/errors.hpp"
#include "rg/fsutil.hpp"
#include "rg/timeutil.hpp"

namespace rg
{
namespace
{
std::optional<std::string> optional_scalar(const YAML::Node &node, const char *key)
{
    const YAML::Node v = node[key];
    if (!v || v.IsNull()) return std::nullopt;
    auto s = v.as<std::string>();
    if (s.empty()) return std::nullopt;
    return s;
}
} // namespace

std::string serialize_state(const SystemState &state)
{
    YAML::Emitter out;
    out << YAML::Comment("resolvguard state - managed file, do not edit");
    out << YAML::BeginMap;
    out << YAML::Key << "active_provider";
    if (state.active_provider_id) out << YAML::Value << *state.active_provider_id;
    else out << YAML::Value << YAML::Null;
    out << YAML::Key << "dot_enabled" << YAML::Value << state.dot_enabled;
    out << YAML::Key << "locked" << YAML::Value << state.locked;
    out << YAML::Key << "last_switch_at";
    if (state.last_switch_at) out << YAML::Value << format_iso8601(*state.last_switch_at);
    else out << YAML::Value << YAML::Null;
    out << YAML::Key << "last_backup";
    if (state.last_backup_ref) out << YAML::Value << *state.last_backup_ref;
    else out << YAML::Value << YAML::Null;
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

SystemState parse_state(const std::string &text)
{
    SystemState state{};
    try
    {
        const YAML::Node root = YAML::Load(text);
        if (!root || root.IsNull()) return state;
        if (!root.IsMap()) throw Error(ErrorKind::IOFailure, "state record is not a mapping");

        state.active_provider_id = optional_scalar(root, "active_provider");
        if (root["dot_enabled"]) state.dot_enabled = root["dot_enabled"].as<bool>();
        if (root["locked"]) state.locked = root["locked"].as<bool>();
        if (auto ts = optional_scalar(root, "last_switch_at"))
        {
            state.last_switch_at = parse_iso8601(*ts);
            if (!state.last_switch_at)
                throw Error(ErrorKind::IOFailure, "state record has invalid last_switch_at '" + *ts + "'");
        }
        state.last_backup_ref = optional_scalar(root, "last_backup");
    }
    catch (const YAML::Exception &e)
    {
        throw Error(ErrorKind::IOFailure, std::string("state record is malformed: ") + e.what());
    }
    return state;
}

StateStore::StateStore(std::string path)
    : path_(std::move(path))
{
}

SystemState StateStore::load() const
{
    auto text = read_file(path_);
    if (!text) return SystemState{};
    try
    {
        return parse_state(*text);
    }
    catch (const Error &e)
    {
        throw Error(ErrorKind::IOFailure, path_ + ": " + e.what());
    }
}

void StateStore::save(const SystemState &state) const
{
    const auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) ensure_directory(parent.string());
    atomic_write(path_, serialize_state(state), SwitchStep::UpdateState, 0644);
}
} // namespace rg
