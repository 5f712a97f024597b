#include <iostream>
#include <string>

#include "passgen/cli_config.hpp"
#include "passgen/entropy_reporter.hpp"
#include "passgen/gen_status.hpp"
#include "passgen/passphrase_generator.hpp"
#include "passgen/presets.hpp"

namespace {

constexpr const char* kProgramName = "pass-gen";

void CliLog(const passgen::GenConfig& config, const std::string& message) {
    if (!config.log) {
        return;
    }
    std::cerr << "[log] " << message << "\n";
}

int Fail(const std::string& message) {
    std::cerr << kProgramName << ": " << message << "\n";
    return 1;
}

void PrintHelp(std::ostream& out) {
    out << "pass-gen - random passphrase generator\n\n";
    out << "Usage:\n";
    out << "  pass-gen [--preset word|ascii|number] [--count N] [--sep S] [--file <path>] [--report] [--log]\n\n";

    out << "Options:\n";
    out << "  -p, --preset <name>  Built-in token pool, resets count and separator (default: word)\n";
    out << "  -c, --count <N>      Number of tokens to generate\n";
    out << "  -s, --sep <S>        Separator printed between tokens\n";
    out << "  -f, --file <path>    Load tokens from a newline-delimited file\n";
    out << "  -r, --report         Print entropy and guess time estimates to stderr\n";
    out << "  -l, --log            Show minimal runtime logs\n";
    out << "  -h, --help           Show this help\n\n";

    out << "Presets:\n";
    for (const auto& preset : passgen::BuiltInPresets()) {
        out << "  " << preset.name << ": " << preset.tokens->size() << " tokens, default count "
            << preset.token_count << "\n";
    }
    out << "\n";

    out << "Examples:\n";
    out << "  pass-gen\n";
    out << "  pass-gen --preset word --count 4 --sep -\n";
    out << "  pass-gen -p ascii -c 24 -r\n";
    out << "  pass-gen --file my_words.txt --count 5 --sep .\n";
}

int GenerateFlow(const passgen::GenConfig& config) {
    CliLog(
        config,
        "Token pool: " + std::to_string(config.token_pool.Size()) +
            (config.token_pool.IsOwned() ? " tokens from file" : " tokens from preset"));

    if (config.token_pool.Empty()) {
        return Fail(std::string(passgen::ToString(passgen::GenStatus::EmptyPool)));
    }

    if (config.report) {
        const passgen::EntropyReport report = passgen::EntropyReporter::Compute(
            static_cast<double>(config.token_pool.Size()),
            static_cast<double>(config.token_count));
        passgen::EntropyReporter::Print(report, std::cerr);
    }

    CliLog(config, "Generating " + std::to_string(config.token_count) + " tokens");
    const passgen::GenStatus status = passgen::PassphraseGenerator::Write(
        config.token_pool, config.token_count, config.token_separator, std::cout);
    std::cout << std::flush;
    if (status != passgen::GenStatus::Ok) {
        return Fail(std::string(passgen::ToString(status)));
    }
    CliLog(config, "Done");
    return 0;
}

}  // namespace

int RunCliMain(const int argc, const char* const argv[]) {
    passgen::GenConfig config;
    std::string error;
    if (!passgen::ParseArgs(argc, argv, config, error)) {
        return Fail(error);
    }

    if (config.help) {
        PrintHelp(std::cout);
        return 0;
    }

    return GenerateFlow(config);
}

int main(const int argc, char* argv[]) {
    return RunCliMain(argc, argv);
}
