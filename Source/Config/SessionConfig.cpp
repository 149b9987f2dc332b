#include "SessionConfig.h"
#include "Core/Errors.h"

#include <yaml-cpp/yaml.h>

namespace
{
template <typename T>
T as(const YAML::Node& value, const std::string& name)
{
    try
    {
        return value.as<T>();
    }
    catch (const YAML::Exception& e)
    {
        throw ConfigError("invalid value for " + name + ": " + e.what());
    }
}
} // namespace

SessionConfig SessionConfig::FromYamlFile(const std::string& path)
{
    YAML::Node root;
    try
    {
        root = YAML::LoadFile(path);
    }
    catch (const YAML::Exception& e)
    {
        throw ConfigError("cannot load config " + path + ": " + e.what());
    }

    SessionConfig config;
    if (!root || root.IsNull()) return config;
    if (!root.IsMap())
    {
        throw ConfigError("config " + path + " must be a mapping");
    }

    for (auto group = root.begin(); group != root.end(); ++group)
    {
        const std::string groupName = group->first.as<std::string>();
        if (group->second.IsScalar())
        {
            config.applyNode("", groupName, group->second);
            continue;
        }
        if (!group->second.IsMap())
        {
            throw ConfigError("config group '" + groupName + "' must be a mapping");
        }
        for (auto entry = group->second.begin(); entry != group->second.end(); ++entry)
        {
            config.applyNode(groupName, entry->first.as<std::string>(), entry->second);
        }
    }
    return config;
}

void SessionConfig::applyOverride(const std::string& assignment)
{
    const auto eq = assignment.find('=');
    if (eq == std::string::npos || eq == 0)
    {
        throw ConfigError("override must look like group.key=value: " + assignment);
    }

    const std::string path = assignment.substr(0, eq);
    const std::string text = assignment.substr(eq + 1);

    std::string group;
    std::string key = path;
    const auto dot = path.find('.');
    if (dot != std::string::npos)
    {
        group = path.substr(0, dot);
        key = path.substr(dot + 1);
    }

    YAML::Node value;
    try
    {
        value = YAML::Load(text);
    }
    catch (const YAML::Exception& e)
    {
        throw ConfigError("cannot parse value in " + assignment + ": " + e.what());
    }
    // "key=" sets an empty string rather than null
    if (value.IsNull()) value = YAML::Node(std::string());

    applyNode(group, key, value);
}

void SessionConfig::applyNode(const std::string& group, const std::string& key,
                              const YAML::Node& value)
{
    const std::string name = group.empty() ? key : group + "." + key;

    if (group.empty())
    {
        if (key == "verbose") verbose = as<bool>(value, name);
        else throw ConfigError("unknown setting " + name);
    }
    else if (group == "audio")
    {
        if (key == "sampleRate") audio.sampleRate = as<unsigned int>(value, name);
        else if (key == "frameSize") audio.frameSize = as<size_t>(value, name);
        else if (key == "deviceIndex") audio.deviceIndex = as<int>(value, name);
        else throw ConfigError("unknown setting " + name);
    }
    else if (group == "segmentation")
    {
        if (key == "silenceThreshold") segmentation.silenceThreshold = as<int>(value, name);
        else if (key == "silenceFramesToClose") segmentation.silenceFramesToClose = as<int>(value, name);
        else if (key == "minSegmentSeconds") segmentation.minSegmentSeconds = as<double>(value, name);
        else if (key == "maxSegmentSeconds") segmentation.maxSegmentSeconds = as<double>(value, name);
        else if (key == "calibrationSeconds") segmentation.calibrationSeconds = as<double>(value, name);
        else if (key == "calibrationMultiplier") segmentation.calibrationMultiplier = as<double>(value, name);
        else if (key == "calibrationFloor") segmentation.calibrationFloor = as<int>(value, name);
        else throw ConfigError("unknown setting " + name);
    }
    else if (group == "engine")
    {
        if (key == "name") engine.name = as<std::string>(value, name);
        else if (key == "modelPath") engine.modelPath = as<std::string>(value, name);
        else if (key == "language") engine.language = as<std::string>(value, name);
        else if (key == "threads") engine.threads = as<int>(value, name);
        else if (key == "cliPath") engine.cliPath = as<std::string>(value, name);
        else throw ConfigError("unknown setting " + name);
    }
    else if (group == "output")
    {
        if (key == "printToConsole") output.printToConsole = as<bool>(value, name);
        else if (key == "transcriptFile") output.transcriptFile = as<std::string>(value, name);
        else if (key == "jsonFile") output.jsonFile = as<std::string>(value, name);
        else if (key == "segmentDumpDir") output.segmentDumpDir = as<std::string>(value, name);
        else throw ConfigError("unknown setting " + name);
    }
    else
    {
        throw ConfigError("unknown config group " + group);
    }
}

void SessionConfig::validate() const
{
    if (audio.sampleRate == 0) throw ConfigError("audio.sampleRate must be positive");
    if (audio.frameSize == 0) throw ConfigError("audio.frameSize must be positive");

    const SegmentationConfig& s = segmentation;
    if (s.silenceThreshold < 0) throw ConfigError("segmentation.silenceThreshold must not be negative");
    if (s.silenceFramesToClose < 1) throw ConfigError("segmentation.silenceFramesToClose must be at least 1");
    if (s.minSegmentSeconds < 0.0) throw ConfigError("segmentation.minSegmentSeconds must not be negative");
    if (s.maxSegmentSeconds <= 0.0) throw ConfigError("segmentation.maxSegmentSeconds must be positive");
    if (s.maxSegmentSeconds < s.minSegmentSeconds)
    {
        throw ConfigError("segmentation.maxSegmentSeconds must not be smaller than minSegmentSeconds");
    }
    if (s.calibrationSeconds < 0.0) throw ConfigError("segmentation.calibrationSeconds must not be negative");
    if (s.calibrationMultiplier <= 0.0) throw ConfigError("segmentation.calibrationMultiplier must be positive");
    if (s.calibrationFloor < 0) throw ConfigError("segmentation.calibrationFloor must not be negative");

    if (engine.name != "whisper" && engine.name != "whisper-cli")
    {
        throw ConfigError("unknown engine '" + engine.name + "' (expected whisper or whisper-cli)");
    }
    if (engine.language.empty()) throw ConfigError("engine.language must not be empty");
    if (engine.threads < 0) throw ConfigError("engine.threads must not be negative");
}
