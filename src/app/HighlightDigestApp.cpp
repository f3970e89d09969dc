/**
 * @file HighlightDigestApp.cpp
 * @brief Implementation of HighlightDigestApp.
 */

#include "app/HighlightDigestApp.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>

#include "application/DigestService.hpp"
#include "application/ImportService.hpp"
#include "application/ThemeMigrationService.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/JsonHighlightRepository.hpp"
#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/OllamaThemeClassifier.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/ResendMailer.hpp"

namespace highlightdigest::app {

namespace {

constexpr size_t kMaxBooksListed = 10;

std::shared_ptr<domain::HighlightRepository> MakeRepository(const infrastructure::AppConfig& config) {
    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    return std::make_shared<infrastructure::JsonHighlightRepository>(config.storePath, persistence);
}

void PrintImportReport(const application::ImportService::ImportResult& result) {
    std::cout << "\nParsing Results:\n"
              << "   Highlights found: " << result.highlightsFound << "\n"
              << "   Bookmarks skipped: " << result.bookmarksSkipped << "\n"
              << "   Notes skipped: " << result.notesSkipped << "\n"
              << "   Empty entries: " << result.emptySkipped << "\n";

    if (result.books.empty()) return;

    std::cout << "\nBooks found (" << result.books.size() << "):\n";
    for (size_t i = 0; i < result.books.size() && i < kMaxBooksListed; ++i) {
        const auto& book = result.books[i];
        std::cout << "   - " << book.title << " by " << book.author << ": " << book.count << " highlights\n";
    }
    if (result.books.size() > kMaxBooksListed) {
        std::cout << "   ... and " << (result.books.size() - kMaxBooksListed) << " more books\n";
    }
    std::cout << std::flush;
}

} // namespace

std::string HighlightDigestApp::Usage() {
    return
        "Usage:\n"
        "  highlight-digest import <clippings.txt> [--output <store.json>] [--dry-run]\n"
        "  highlight-digest send [--count N] [--output <store.json>]\n"
        "  highlight-digest preview [--count N] [--output <store.json>]\n"
        "  highlight-digest classify [--output <store.json>]\n"
        "\n"
        "Common options:\n"
        "  --config <settings.json>   Settings file (default: $XDG_CONFIG_HOME/HighlightDigest/settings.json)\n";
}

bool HighlightDigestApp::ParseArgs(const std::vector<std::string>& args, Options& out, std::string& error) {
    if (args.empty()) {
        error = "missing command";
        return false;
    }
    out.command = args[0];
    if (out.command != "import" && out.command != "send" && out.command != "preview" && out.command != "classify") {
        error = "unknown command '" + out.command + "'";
        return false;
    }

    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto needValue = [&](std::string& target) {
            if (i + 1 >= args.size()) {
                error = arg + " requires a value";
                return false;
            }
            target = args[++i];
            return true;
        };

        if (arg == "--output" || arg == "-o") {
            if (!needValue(out.outputPath)) return false;
        } else if (arg == "--config") {
            if (!needValue(out.settingsPath)) return false;
        } else if (arg == "--count" || arg == "-c") {
            std::string raw;
            if (!needValue(raw)) return false;
            try {
                size_t consumed = 0;
                out.count = std::stoi(raw, &consumed);
                if (consumed != raw.size() || out.count < 0) throw std::invalid_argument(raw);
            } catch (const std::exception&) {
                error = "--count expects a non-negative integer, got '" + raw + "'";
                return false;
            }
        } else if (arg == "--dry-run" || arg == "-n") {
            out.dryRun = true;
        } else if (!arg.empty() && arg[0] == '-') {
            error = "unknown option '" + arg + "'";
            return false;
        } else if (out.command == "import" && out.clippingsPath.empty()) {
            out.clippingsPath = arg;
        } else {
            error = "unexpected argument '" + arg + "'";
            return false;
        }
    }

    if (out.command == "import" && out.clippingsPath.empty()) {
        error = "import requires the path to a clippings file";
        return false;
    }
    return true;
}

int HighlightDigestApp::Run(const std::vector<std::string>& args) {
    Options options;
    std::string error;
    if (!ParseArgs(args, options, error)) {
        std::cerr << "Error: " << error << "\n\n" << Usage();
        return 1;
    }

    std::string settingsPath = options.settingsPath.empty()
        ? infrastructure::PathUtils::GetDefaultSettingsPath().string()
        : options.settingsPath;
    infrastructure::AppConfig config = infrastructure::ConfigLoader::Load(settingsPath);
    if (!options.outputPath.empty()) {
        config.storePath = options.outputPath;
    }
    if (options.count >= 0) {
        config.highlightsCount = options.count;
    }

    try {
        if (options.command == "import") return RunImport(options, config);
        if (options.command == "send") return RunSend(config);
        if (options.command == "preview") return RunPreview(config);
        return RunClassify(config);
    } catch (const domain::DigestError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[HighlightDigestApp] Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}

int HighlightDigestApp::RunImport(const Options& options, const infrastructure::AppConfig& config) {
    application::ImportService service(MakeRepository(config), domain::HighlightMerger());
    auto result = service.importFile(options.clippingsPath, options.dryRun);
    PrintImportReport(result);

    if (result.highlightsFound == 0) {
        return 1;
    }
    if (result.saved) {
        std::cout << "\nImport complete!\n"
                  << "   Existing highlights: " << result.existingCount << "\n"
                  << "   New highlights added: " << result.addedCount << "\n"
                  << "   Total highlights: " << result.totalCount << "\n"
                  << "   Saved to: " << config.storePath << std::endl;
    }
    return 0;
}

int HighlightDigestApp::RunSend(const infrastructure::AppConfig& config) {
    infrastructure::ConfigLoader::RequireDeliverySettings(config);

    auto sender = std::make_shared<infrastructure::ResendMailer>(*config.resendApiKey);
    application::DigestService service(MakeRepository(config), sender, domain::HighlightSampler());
    service.sendDaily(*config.toEmail, config.fromEmail, static_cast<size_t>(config.highlightsCount));
    return 0;
}

int HighlightDigestApp::RunPreview(const infrastructure::AppConfig& config) {
    application::DigestService service(MakeRepository(config), nullptr, domain::HighlightSampler());
    auto doc = service.preview(static_cast<size_t>(config.highlightsCount));
    std::cout << doc.html;
    return 0;
}

int HighlightDigestApp::RunClassify(const infrastructure::AppConfig& config) {
    auto client = std::make_shared<infrastructure::OllamaClient>(config.ollamaHost, config.ollamaPort);
    auto classifier = std::make_shared<infrastructure::OllamaThemeClassifier>(
        client, config.classifierModel, config.themeThreshold);
    application::ThemeMigrationService service(MakeRepository(config), classifier);

    auto result = service.classifyMissing();
    if (result.highlightsUpdated > 0) {
        std::cout << "\nDone! Updated " << result.highlightsUpdated << " highlights ("
                  << result.booksClassified << "/" << result.booksPending << " books).\n"
                  << "Saved to: " << config.storePath << std::endl;
    }
    return 0;
}

} // namespace highlightdigest::app
