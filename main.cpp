#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <future>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <shellapi.h>
#endif

#include "wincloud/archive_codec.hpp"
#include "wincloud/archive_engine.hpp"
#include "wincloud/client_config.hpp"
#include "wincloud/crypto_manager.hpp"
#include "wincloud/curl_transport.hpp"
#include "wincloud/file_io.hpp"
#include "wincloud/key_provider.hpp"
#include "wincloud/log.hpp"
#include "wincloud/transfer_client.hpp"
#include "wincloud/wc_status.hpp"

namespace {

constexpr std::string_view kComponent = "cli";
constexpr std::chrono::milliseconds kProgressPoll{100};

struct CliOptions {
    std::string command;
    bool help = false;
    bool log = false;
    bool verbose = false;
    std::optional<std::string> server;
    std::optional<std::string> config;
    std::optional<std::string> key_file;
    std::optional<std::string> out;
    std::optional<std::string> out_dir;
    std::optional<int> local_percent;
    std::optional<std::string> password;
    std::vector<std::string> positional;
};

std::string UnquotePathArg(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    const char first = value.front();
    const char last = value.back();
    if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

bool ParseInt(const std::string& text, int& out_value) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    const long parsed = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0' || parsed < -1000000L || parsed > 1000000L) {
        return false;
    }
    out_value = static_cast<int>(parsed);
    return true;
}

#ifdef _WIN32
bool WideToUtf8(const wchar_t* input, std::string& out) {
    out.clear();
    if (input == nullptr) {
        return false;
    }
    const int required = WideCharToMultiByte(CP_UTF8, 0, input, -1, nullptr, 0, nullptr, nullptr);
    if (required <= 0) {
        return false;
    }
    std::vector<char> converted(static_cast<std::size_t>(required), '\0');
    const int written = WideCharToMultiByte(CP_UTF8, 0, input, -1, converted.data(), required, nullptr, nullptr);
    if (written <= 0) {
        return false;
    }
    out.assign(converted.data(), static_cast<std::size_t>(written - 1));
    return true;
}

bool BuildUtf8ArgsFromCommandLine(std::vector<std::string>& out_args) {
    out_args.clear();
    int wide_argc = 0;
    LPWSTR* wide_argv = CommandLineToArgvW(GetCommandLineW(), &wide_argc);
    if (wide_argv == nullptr || wide_argc <= 0) {
        return false;
    }

    out_args.reserve(static_cast<std::size_t>(wide_argc));
    bool ok = true;
    for (int i = 0; i < wide_argc; ++i) {
        std::string converted;
        if (!WideToUtf8(wide_argv[i], converted)) {
            ok = false;
            break;
        }
        out_args.push_back(std::move(converted));
    }
    LocalFree(wide_argv);
    return ok;
}
#endif

void CliLog(const std::string& message) {
    wincloud::LogInfo(kComponent, message);
}

int ReportFailure(const wincloud::WcStatus status, const std::string& message) {
    std::cerr << wincloud::ToString(status) << " (" << wincloud::ToString(wincloud::CategoryOf(status)) << ")";
    if (!message.empty()) {
        std::cerr << ": " << message;
    }
    std::cerr << "\n";
    return 1;
}

bool ParseArgs(const int argc, char* argv[], CliOptions& opts, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        auto require_value = [&](std::string& dst) -> bool {
            if (i + 1 >= argc) {
                error = "Missing value for " + arg;
                return false;
            }
            dst = argv[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--log") {
            opts.log = true;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--server") {
            std::string v;
            if (!require_value(v)) {
                return false;
            }
            opts.server = std::move(v);
        } else if (arg == "--config") {
            std::string v;
            if (!require_value(v)) {
                return false;
            }
            opts.config = UnquotePathArg(std::move(v));
        } else if (arg == "--key-file") {
            std::string v;
            if (!require_value(v)) {
                return false;
            }
            opts.key_file = UnquotePathArg(std::move(v));
        } else if (arg == "--out") {
            std::string v;
            if (!require_value(v)) {
                return false;
            }
            opts.out = UnquotePathArg(std::move(v));
        } else if (arg == "--out-dir") {
            std::string v;
            if (!require_value(v)) {
                return false;
            }
            opts.out_dir = UnquotePathArg(std::move(v));
        } else if (arg == "--local-percent") {
            std::string v;
            if (!require_value(v)) {
                return false;
            }
            int parsed = 0;
            if (!ParseInt(v, parsed) || parsed < 0 || parsed > 100) {
                error = "Invalid value for --local-percent";
                return false;
            }
            opts.local_percent = parsed;
        } else if (arg == "--password") {
            std::string v;
            if (!require_value(v)) {
                return false;
            }
            opts.password = std::move(v);
        } else if (arg.size() > 1 && arg[0] == '-') {
            error = "Unknown argument: " + arg;
            return false;
        } else if (opts.command.empty()) {
            opts.command = arg;
        } else {
            opts.positional.push_back(UnquotePathArg(arg));
        }
    }

    if (opts.help) {
        return true;
    }
    if (opts.command.empty()) {
        error = "Missing command";
        return false;
    }

    if (opts.command == "create") {
        if (!opts.out.has_value()) {
            error = "Missing required argument --out";
            return false;
        }
        if (opts.positional.empty()) {
            error = "Provide at least one input file";
            return false;
        }
        return true;
    }
    if (opts.command == "extract" || opts.command == "inspect" || opts.command == "delete") {
        if (opts.positional.size() != 1) {
            error = opts.command == "delete" ? "Provide exactly one cloud archive id" : "Provide exactly one archive path";
            return false;
        }
        return true;
    }
    if (opts.command == "health" || opts.command == "gen-key") {
        if (!opts.positional.empty()) {
            error = "Unexpected argument: " + opts.positional.front();
            return false;
        }
        return true;
    }
    error = "Unknown command: " + opts.command;
    return false;
}

void PrintHelp(std::ostream& out) {
    out << "WinCloud - hybrid local/cloud archiver\n\n";
    out << "Usage:\n";
    out << "  wincloud create --out <archive> [--local-percent N] [--password P] <files...>\n";
    out << "  wincloud extract <archive> [--out-dir <dir>] [--password P]\n";
    out << "  wincloud inspect <archive>\n";
    out << "  wincloud health\n";
    out << "  wincloud delete <cloud-archive-id>\n";
    out << "  wincloud gen-key [--key-file <path>]\n\n";

    out << "Options:\n";
    out << "  --out <path>           Archive to create\n";
    out << "  --out-dir <dir>        Extraction directory (default: next to the archive)\n";
    out << "  --local-percent <N>    Share of each compressed file kept locally, 0..100 (default 10)\n";
    out << "  --password <string>    Protect the cloud part with a password-derived key\n";
    out << "  --server <url>         Remote store base URL\n";
    out << "  --config <path>        Config file (default ~/.wincloud/config.json)\n";
    out << "  --key-file <path>      Key file (default ~/.wincloud/.key)\n";
    out << "  --log                  Show progress and informational logs\n";
    out << "  --verbose              Show debug logs\n";
    out << "  --help, -h             Show this help\n\n";

    out << "Examples:\n";
    out << "  wincloud create --out photos.wca a.jpg b.jpg\n";
    out << "  wincloud extract photos.wca --out-dir restored\n";
    out << "  wincloud inspect photos.wca\n\n";

    out << "Notes:\n";
    out << "  - Extraction needs both the local archive and the remote store.\n";
    out << "  - Path arguments accept both plain and quoted values.\n";
}

bool BuildConfig(const CliOptions& opts, wincloud::ClientConfig& out_config, std::string& error) {
    wincloud::ClientConfig config;
    const bool explicit_config = opts.config.has_value();
    const std::string path = explicit_config ? *opts.config : wincloud::DefaultConfigPath();
    const wincloud::WcStatus status = wincloud::LoadClientConfig(path, !explicit_config, config);
    if (status != wincloud::WcStatus::Ok) {
        error = "Cannot load config " + path + ": " + std::string(wincloud::ToString(status));
        return false;
    }

    if (opts.server.has_value()) {
        config.server_url = *opts.server;
    }
    if (opts.key_file.has_value()) {
        config.key_path = *opts.key_file;
    }
    if (opts.local_percent.has_value()) {
        config.local_percentage = *opts.local_percent;
    }
    out_config = config;
    return true;
}

std::shared_ptr<wincloud::TransferClient> MakeTransferClient(const wincloud::ClientConfig& config) {
    wincloud::CurlTransportOptions transport_options;
    transport_options.verify_tls = config.verify_tls;
    transport_options.user_agent = "wincloud/" + config.client_version;
    auto transport = std::make_shared<wincloud::CurlTransport>(transport_options);
    return std::make_shared<wincloud::TransferClient>(transport, wincloud::TransferOptions::FromConfig(config));
}

std::unique_ptr<wincloud::ArchiveEngine> MakeEngine(const CliOptions& opts, const wincloud::ClientConfig& config) {
    auto key_provider = std::make_shared<wincloud::FileKeyProvider>(config.key_path);
    auto crypto = std::make_shared<wincloud::CryptoManager>(key_provider);
    wincloud::EngineOptions engine_options = wincloud::EngineOptions::FromConfig(config);
    if (opts.password.has_value()) {
        engine_options.password = *opts.password;
    }
    return std::make_unique<wincloud::ArchiveEngine>(crypto, MakeTransferClient(config), engine_options);
}

template <typename Result>
Result WaitWithProgress(wincloud::ArchiveEngine& engine, std::future<Result>& future) {
    while (future.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
        const auto event = engine.progress().WaitNext(kProgressPoll);
        if (event.has_value()) {
            CliLog(std::to_string(event->percent) + "% " + event->message);
        }
    }
    while (const auto event = engine.progress().TryNext()) {
        CliLog(std::to_string(event->percent) + "% " + event->message);
    }
    return future.get();
}

std::string FormatSize(const std::uint64_t bytes) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << static_cast<double>(bytes) / (1024.0 * 1024.0) << " MB";
    return out.str();
}

int CreateFlow(const CliOptions& opts, const wincloud::ClientConfig& config) {
    auto engine = MakeEngine(opts, config);
    CliLog("Starting archive creation");
    auto future = engine->StartCreate(opts.positional, *opts.out);
    const wincloud::CreateResult result = WaitWithProgress(*engine, future);
    if (!result.ok()) {
        return ReportFailure(result.status, result.message);
    }

    for (const auto& skipped : result.skipped) {
        std::cerr << "skipped: " << skipped << "\n";
    }
    std::cout << "Archive created: " << result.archive_path << "\n";
    std::cout << "Original: " << FormatSize(result.manifest.total_size) << "\n";
    std::cout << "Archive: " << FormatSize(result.archive_size) << "\n";
    std::cout << "Ratio: " << std::fixed << std::setprecision(1) << result.compression_ratio << "%\n";
    if (result.uploaded()) {
        std::cout << "Cloud archive: " << *result.manifest.cloud_archive_id << "\n";
    } else {
        std::cout << "Cloud upload failed, archive is local-only: " << result.manifest.cloud_error.value_or("") << "\n";
    }
    return 0;
}

int ExtractFlow(const CliOptions& opts, const wincloud::ClientConfig& config) {
    auto engine = MakeEngine(opts, config);
    CliLog("Starting extraction");
    auto future = engine->StartExtract(opts.positional.front(), opts.out_dir.value_or(""));
    const wincloud::ExtractResult result = WaitWithProgress(*engine, future);
    if (!result.ok()) {
        return ReportFailure(result.status, result.message);
    }
    for (const auto& path : result.extracted) {
        std::cout << path << "\n";
    }
    std::cout << "Extracted " << result.extracted.size() << " file(s) to " << result.output_dir << "\n";
    return 0;
}

int InspectFlow(const CliOptions& opts) {
    wincloud::ArchiveManifest manifest;
    const wincloud::WcStatus status = wincloud::ArchiveCodec::ReadManifest(opts.positional.front(), manifest);
    if (status != wincloud::WcStatus::Ok) {
        return ReportFailure(status, "cannot read archive " + opts.positional.front());
    }

    std::cout << "Version: " << manifest.version << "\n";
    std::cout << "Created: " << std::fixed << std::setprecision(3) << manifest.created << "\n";
    std::cout << "Compression: " << manifest.compression << "\n";
    std::cout << "Total size: " << manifest.total_size << " bytes\n";
    std::cout << "Local payload: " << manifest.LocalPayloadSize() << " bytes\n";
    std::cout << "Cloud payload: " << manifest.CloudPayloadSize() << " bytes\n";
    std::cout << "Cloud archive: " << manifest.cloud_archive_id.value_or("(none)") << "\n";
    if (manifest.cloud_error.has_value()) {
        std::cout << "Cloud error: " << *manifest.cloud_error << "\n";
    }
    if (manifest.kdf_salt.has_value()) {
        std::cout << "Password protected: yes\n";
    }
    std::cout << "Files: " << manifest.files.size() << "\n";
    for (const auto& record : manifest.files) {
        std::cout << "  " << record.name << "  " << record.size << " -> " << record.compressed_size << " (local "
                  << record.local_size << ", cloud " << record.cloud_size << ")\n";
    }
    return 0;
}

int HealthFlow(const wincloud::ClientConfig& config) {
    auto client = MakeTransferClient(config);
    if (!client->Health()) {
        return ReportFailure(wincloud::WcStatus::ServerUnavailable, "server " + config.server_url + " is not reachable");
    }
    std::cout << "Server " << config.server_url << " is reachable\n";
    return 0;
}

int DeleteFlow(const CliOptions& opts, const wincloud::ClientConfig& config) {
    auto client = MakeTransferClient(config);
    const wincloud::TransferResult result = client->Delete(opts.positional.front());
    if (!result.ok()) {
        return ReportFailure(result.status, result.message);
    }
    std::cout << "Deleted " << opts.positional.front() << "\n";
    return 0;
}

int GenKeyFlow(const wincloud::ClientConfig& config) {
    wincloud::FileKeyProvider provider(config.key_path);
    std::error_code ec;
    const bool existed = std::filesystem::exists(wincloud::PathFromUtf8(provider.key_path()), ec);
    wincloud::KeyBytes key{};
    const wincloud::WcStatus status = provider.LoadKey(key);
    wincloud::SecureWipeArray(key);
    if (status != wincloud::WcStatus::Ok) {
        return ReportFailure(status, "key file " + provider.key_path());
    }
    std::cout << (existed ? "Key already present: " : "Key created: ") << provider.key_path() << "\n";
    return 0;
}

}  // namespace

int RunCliMain(const int argc, char* argv[]) {
    CliOptions opts;
    std::string error;
    if (!ParseArgs(argc, argv, opts, error)) {
        std::cerr << error << "\n";
        PrintHelp(std::cerr);
        return 1;
    }
    if (opts.help) {
        PrintHelp(std::cout);
        return 0;
    }

    if (opts.verbose) {
        wincloud::SetLogLevel(wincloud::LogLevel::Debug);
    } else if (opts.log) {
        wincloud::SetLogLevel(wincloud::LogLevel::Info);
    }

    if (opts.command == "inspect") {
        return InspectFlow(opts);
    }

    wincloud::ClientConfig config;
    if (!BuildConfig(opts, config, error)) {
        std::cerr << error << "\n";
        return 1;
    }
    const wincloud::WcStatus valid = wincloud::ValidateClientConfig(config);
    if (valid != wincloud::WcStatus::Ok) {
        return ReportFailure(valid, "invalid configuration");
    }

    if (opts.command == "create") {
        return CreateFlow(opts, config);
    }
    if (opts.command == "extract") {
        return ExtractFlow(opts, config);
    }
    if (opts.command == "health") {
        return HealthFlow(config);
    }
    if (opts.command == "delete") {
        return DeleteFlow(opts, config);
    }
    return GenKeyFlow(config);
}

#ifdef _WIN32
int main(const int argc, char* argv[]) {
    std::vector<std::string> utf8_args;
    if (BuildUtf8ArgsFromCommandLine(utf8_args)) {
        std::vector<char*> utf8_argv;
        utf8_argv.reserve(utf8_args.size());
        for (auto& arg : utf8_args) {
            utf8_argv.push_back(arg.data());
        }
        return RunCliMain(static_cast<int>(utf8_argv.size()), utf8_argv.data());
    }
    return RunCliMain(argc, argv);
}
#else
int main(const int argc, char* argv[]) {
    return RunCliMain(argc, argv);
}
#endif
