#pragma once

#include <cstddef>
#include <string>

namespace YAML
{
class Node;
}

struct AudioConfig
{
    unsigned int sampleRate = 16000;
    size_t frameSize = 4000; // samples per frame, 250 ms at 16 kHz
    int deviceIndex = -1;    // -1 = system default
};

struct SegmentationConfig
{
    int silenceThreshold = 300;       // peak amplitude below which a frame is silent
    int silenceFramesToClose = 8;     // consecutive silent frames that end a segment
    double minSegmentSeconds = 1.0;   // silence cannot close a segment shorter than this
    double maxSegmentSeconds = 30.0;  // hard cap, closes regardless of silence

    // ambient calibration before recording; 0 disables it
    double calibrationSeconds = 0.0;
    double calibrationMultiplier = 1.5;
    int calibrationFloor = 100;
};

struct EngineConfig
{
    std::string name = "whisper"; // "whisper" or "whisper-cli"
    std::string modelPath = "models/ggml-base.en.bin";
    std::string language = "en";
    int threads = 0;              // 0 = hardware concurrency
    std::string cliPath = "whisper-cli";
};

struct OutputConfig
{
    bool printToConsole = true;
    std::string transcriptFile; // appended line by line, empty = off
    std::string jsonFile;       // written when the program exits, empty = off
    std::string segmentDumpDir; // one WAV per closed segment, empty = off
};

struct SessionConfig
{
    AudioConfig audio;
    SegmentationConfig segmentation;
    EngineConfig engine;
    OutputConfig output;
    bool verbose = false;

    /**
     * Load a YAML file laid out like the structs above, e.g.
     *   segmentation:
     *     silenceThreshold: 500
     * Keys that are absent keep their defaults. Throws ConfigError.
     */
    static SessionConfig FromYamlFile(const std::string& path);

    // "group.key=value", e.g. "segmentation.maxSegmentSeconds=20". Throws ConfigError.
    void applyOverride(const std::string& assignment);

    // Throws ConfigError describing the first invalid setting.
    void validate() const;

private:
    void applyNode(const std::string& group, const std::string& key, const YAML::Node& value);
};
