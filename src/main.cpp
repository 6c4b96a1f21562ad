#include "build/build_tool.hpp"
#include "build/orchestrator.hpp"
#include "build/source_control.hpp"
#include "crypto/sha256.hpp"
#include "package/bundle_reader.hpp"
#include "util/logger.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

enum : int {
    kOptBuildTool = 1000,
};

void PrintUsage(const char* argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s build   [-t dev|release] [-n NAME] [-b BUILD_DIR] [-k KEY] [-o OUTPUT_DIR]\n"
        "             [-p PROJECT_DIR] [-c CONFIG] [--build-tool CMD] [-v]\n"
        "   %s package [-t dev|release] [-n NAME] [-b BUILD_DIR] [-k KEY] [-o OUTPUT_DIR]\n"
        "             [-p PROJECT_DIR] [-c CONFIG] [-v]\n"
        "   %s inspect BUNDLE\n"
        "\n"
        "Options:\n"
        "  -t, --type          Build type: dev or release (default release)\n"
        "  -n, --name          Release name (default: exact tag, else short commit)\n"
        "  -b, --build-dir     Build directory (default <root>/build)\n"
        "  -k, --signing-key   Secure boot signing key (default <root>/keys/secure_boot_signing_key.pem)\n"
        "  -o, --output-dir    Bundle output directory (default <root>/release)\n"
        "  -p, --project-dir   Project root (default: nearest directory holding .git)\n"
        "  -c, --config        Config file (default <root>/fwbundle.json if present)\n"
        "      --build-tool    Firmware build command (default idf.py)\n"
        "  -v, --verbose       Debug logging\n"
        "  -h, --help          Show this help\n",
        argv0, argv0, argv0);
}

int RunInspect(const std::string& bundle_path) {
    std::vector<fwbundle::BundleEntry> entries;
    if (auto r = fwbundle::BundleReader::ReadAll(bundle_path, entries); !r.ok) {
        std::fprintf(stderr, "ERROR: %s: %s\n", fwbundle::ErrorKindName(r.err), r.msg.c_str());
        return kExitFailure;
    }

    for (const auto& e : entries) {
        const auto* bytes = reinterpret_cast<const std::uint8_t*>(e.data.data());
        const std::string hex = fwbundle::Sha256Hex(std::span<const std::uint8_t>(bytes, e.data.size()));
        std::printf("%04o %10llu  %s  %s\n",
                    e.info.perm,
                    static_cast<unsigned long long>(e.info.size),
                    hex.c_str(),
                    e.info.name.c_str());
    }
    return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    const std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        PrintUsage(argv[0]);
        return kExitOk;
    }

    if (command == "inspect") {
        if (argc != 3) {
            PrintUsage(argv[0]);
            return kExitUsage;
        }
        return RunInspect(argv[2]);
    }

    fwbundle::OrchestratorRequest req;
    if (command == "build") {
        req.mode = fwbundle::PipelineMode::BuildAndPackage;
    } else if (command == "package") {
        req.mode = fwbundle::PipelineMode::PackageOnly;
    } else {
        std::fprintf(stderr, "Unknown command: %s\n", command.c_str());
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    static option long_opts[] = {
        {"type", required_argument, nullptr, 't'},
        {"name", required_argument, nullptr, 'n'},
        {"build-dir", required_argument, nullptr, 'b'},
        {"signing-key", required_argument, nullptr, 'k'},
        {"output-dir", required_argument, nullptr, 'o'},
        {"project-dir", required_argument, nullptr, 'p'},
        {"config", required_argument, nullptr, 'c'},
        {"build-tool", required_argument, nullptr, kOptBuildTool},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    // Options follow the subcommand.
    optind = 2;
    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "ht:n:b:k:o:p:c:v", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return kExitOk;
            case 't':
                req.build_type = optarg;
                break;
            case 'n':
                req.release_name = optarg;
                break;
            case 'b':
                req.build_dir = optarg;
                break;
            case 'k':
                req.signing_key = optarg;
                break;
            case 'o':
                req.output_dir = optarg;
                break;
            case 'p':
                req.project_dir = optarg;
                break;
            case 'c':
                req.config_path = optarg;
                break;
            case kOptBuildTool:
                if (req.mode != fwbundle::PipelineMode::BuildAndPackage) {
                    std::fprintf(stderr, "--build-tool is only valid with 'build'\n");
                    return kExitUsage;
                }
                req.build_tool = optarg;
                break;
            case 'v':
                req.log_level = fwbundle::LogLevel::Debug;
                break;
            default:
                PrintUsage(argv[0]);
                return kExitUsage;
        }
    }

    if (optind < argc) {
        std::fprintf(stderr, "Unexpected argument: %s\n", argv[optind]);
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    if (req.build_type && *req.build_type != "dev" && *req.build_type != "release") {
        std::fprintf(stderr, "Invalid --type: %s (use 'dev' or 'release')\n", req.build_type->c_str());
        return kExitUsage;
    }

    if (req.log_level) {
        fwbundle::Logger::Instance().SetLevel(*req.log_level);
    }

    const char* idf_path = std::getenv("IDF_PATH");
    auto source_control = std::make_shared<fwbundle::GitSourceControl>();
    auto build_tool = std::make_shared<fwbundle::IdfBuildTool>(idf_path ? idf_path : "");

    fwbundle::BuildOrchestrator orchestrator(source_control, build_tool);
    fwbundle::OrchestratorOutcome outcome;
    auto res = orchestrator.Run(req, outcome);
    if (!res.ok) {
        std::fprintf(stderr, "ERROR [%s] %s: %s\n",
                     fwbundle::PipelineStageName(orchestrator.LastStage()),
                     fwbundle::ErrorKindName(res.err),
                     res.msg.c_str());
        return kExitFailure;
    }

    std::printf("%s\n", outcome.package.bundle_path.c_str());
    return kExitOk;
}
