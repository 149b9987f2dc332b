#include "Transcription/WhisperCliEngine.h"
#include "Core/Errors.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace {
// a stand-in for whisper-cli: prints a fixed transcript and exits with the given code
std::string WriteScript(const std::string& name, const std::string& body) {
    const auto path = std::filesystem::temp_directory_path() /
                      ("livescribe_" + std::to_string(::getpid()) + "_" + name);
    {
        std::ofstream out(path);
        out << "#!/bin/sh\n" << body;
    }
    std::filesystem::permissions(path, std::filesystem::perms::owner_all);
    return path.string();
}
} // namespace

TEST(WhisperCliEngine, BuildsQuotedCommand) {
    WhisperCliEngine engine("whisper-cli", "/models/it's.bin", 4);
    EXPECT_EQ(engine.buildCommand("/tmp/a b.wav", "en"),
              "'whisper-cli' -m '/models/it'\\''s.bin' -l 'en' -nt -np -t 4 -f '/tmp/a b.wav' 2>/dev/null");
}

TEST(WhisperCliEngine, VerboseKeepsStderr) {
    WhisperCliEngine engine("/opt/whisper-cli", "m.bin", 0, true);
    EXPECT_EQ(engine.name(), "whisper-cli");
    EXPECT_EQ(engine.buildCommand("x.wav", "de"), "'/opt/whisper-cli' -m 'm.bin' -l 'de' -nt -np -f 'x.wav'");
}

TEST(WhisperCliEngine, CollectsPrintedLines) {
    const std::string cli = WriteScript("cli_ok.sh",
                                        "echo '  hello there '\n"
                                        "echo '[BLANK_AUDIO]'\n"
                                        "echo ''\n"
                                        "printf 'general kenobi'\n");
    WhisperCliEngine engine(cli, "model.bin");

    const auto fragments = engine.transcribe(std::vector<float>(1600, 0.25f), 16000, "en");
    ASSERT_EQ(fragments.size(), 2u);
    EXPECT_EQ(fragments[0], "hello there");
    EXPECT_EQ(fragments[1], "general kenobi");

    std::filesystem::remove(cli);
}

TEST(WhisperCliEngine, FailingProcessThrows) {
    const std::string cli = WriteScript("cli_fail.sh", "echo partial\nexit 3\n");
    WhisperCliEngine engine(cli, "model.bin");

    EXPECT_THROW(engine.transcribe(std::vector<float>(1600, 0.1f), 16000, "en"),
                 TranscriptionEngineError);
    std::filesystem::remove(cli);
}

TEST(WhisperCliEngine, EmptyInputSkipsProcess) {
    WhisperCliEngine engine("/nonexistent/whisper-cli", "model.bin");
    EXPECT_TRUE(engine.transcribe({}, 16000, "en").empty());
}
