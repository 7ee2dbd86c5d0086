//
// Created by Giuseppe Francione on 09/12/25.
//

/**
 * @file unmeta.cpp
 * @brief Implementation of the public Unmeta API.
 */

#include "../../include/unmeta.hpp"

#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/log_sink.hpp"
#include "../../include/parser_registry.hpp"

namespace fs = std::filesystem;

namespace unmeta {

// bridge sink to redirect static logs to the instance observer
class BridgeLogSink final : public ILogSink {
    UnmetaObserver* observer_;
public:
    explicit BridgeLogSink(UnmetaObserver* obs) : observer_(obs) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        if (observer_) {
            observer_->onLog(static_cast<int>(level), std::string(message), std::string(tag));
        }
    }
};

namespace {

    // installs the bridge sink for the duration of one clean() call
    class ScopedBridge {
    public:
        explicit ScopedBridge(UnmetaObserver* observer) {
            if (observer) {
                auto sink = std::make_unique<BridgeLogSink>(observer);
                sink_ = sink.get();
                Logger::add_sink(std::move(sink));
            }
        }

        ~ScopedBridge() {
            if (sink_) {
                Logger::remove_sink(sink_);
            }
        }

        ScopedBridge(const ScopedBridge&) = delete;
        ScopedBridge& operator=(const ScopedBridge&) = delete;

    private:
        const ILogSink* sink_ = nullptr;
    };

} // namespace

struct Unmeta::Impl {
    ParserRegistry registry;

    bool lightweight = false;
    bool inPlace = false;
    fs::path outputDir;

    UnmetaObserver* observer = nullptr;

    void fail(CleanResult& result, const std::string& error) const {
        result.error = error;
        Logger::log(LogLevel::Error, result.path.string() + ": " + error, "unmeta");
        if (observer) observer->onFileError(result.path, error);
    }

    // moves a cleaned file into outputDir, keeping its name
    bool relocate(CleanResult& result, const fs::path& cleaned) const {
        std::error_code ec;
        fs::create_directories(outputDir, ec);
        if (ec) {
            fail(result, "Cannot create output directory " + outputDir.string() + ": " + ec.message());
            return false;
        }

        const fs::path dest = outputDir / cleaned.filename();
        fs::rename(cleaned, dest, ec);
        if (ec == std::errc::cross_device_link) {
            ec.clear();
            fs::copy_file(cleaned, dest, fs::copy_options::overwrite_existing, ec);
            if (!ec) {
                std::error_code rm_ec;
                remove_file_logged(cleaned, rm_ec, "unmeta");
            }
        }
        if (ec) {
            fail(result, "Cannot move " + cleaned.string() + " to " + dest.string() + ": " + ec.message());
            return false;
        }
        result.output = dest;
        return true;
    }

    CleanResult cleanOne(const fs::path& path) const {
        CleanResult result;
        result.path = path;
        if (observer) observer->onFileStart(path);

        try {
            auto parser = registry.create_for(path);
            if (!parser) {
                result.skipped = true;
                Logger::log(LogLevel::Warning, "Unsupported format: " + path.string(), "unmeta");
                if (observer) observer->onFileSkipped(path, "Unsupported format");
                return result;
            }

            parser->set_lightweight_cleaning(lightweight);
            if (inPlace) {
                parser->set_edit_in_place();
            }

            if (!parser->remove_all()) {
                parser->finalize();
                fail(result, "Cleaning reported failure");
                return result;
            }

            fs::path output = parser->output_filename();
            if (inPlace) {
                const SwapReport report = parser->finalize();
                if (!report.ok()) {
                    std::string error = "was NOT cleaned: " + report.reason;
                    if (!report.temp_removed) {
                        error += " (temporary file left at " + output.string() + ": " + report.cleanup_error + ")";
                    }
                    fail(result, error);
                    return result;
                }
                output = parser->filename();
            }
            parser.reset();

            if (!inPlace && !outputDir.empty()) {
                if (!relocate(result, output)) return result;
            } else {
                result.output = output;
            }
        } catch (const std::exception& e) {
            // the parser, if any, was already destroyed: its temp file is gone
            fail(result, e.what());
            return result;
        }

        result.cleaned = true;
        Logger::log(LogLevel::Info, "Cleaned " + path.string() + " -> " + result.output.string(), "unmeta");
        if (observer) observer->onFileCleaned(path, result.output);
        return result;
    }
};

Unmeta::Unmeta() : impl_(std::make_unique<Impl>()) {}

Unmeta::~Unmeta() = default;

Unmeta::Unmeta(Unmeta&&) noexcept = default;
Unmeta& Unmeta::operator=(Unmeta&&) noexcept = default;

Unmeta& Unmeta::lightweight(const bool val) {
    impl_->lightweight = val;
    return *this;
}

Unmeta& Unmeta::inPlace(const bool val) {
    impl_->inPlace = val;
    return *this;
}

Unmeta& Unmeta::outputDirectory(const fs::path& dir) {
    impl_->outputDir = dir;
    return *this;
}

void Unmeta::setObserver(UnmetaObserver* observer) {
    impl_->observer = observer;
}

MetaMap Unmeta::show(const fs::path& path) const {
    const auto parser = impl_->registry.create_for(path);
    if (!parser) {
        throw InvalidInputError("Unsupported format: " + path.string());
    }
    return parser->get_meta();
}

std::vector<CleanResult> Unmeta::clean(const std::vector<fs::path>& paths) {
    ScopedBridge bridge(impl_->observer);

    std::vector<CleanResult> results;
    results.reserve(paths.size());
    for (const auto& path : paths) {
        results.push_back(impl_->cleanOne(path));
    }
    return results;
}

CleanResult Unmeta::clean(const fs::path& path) {
    return clean(std::vector<fs::path>{path}).front();
}

const ParserRegistry& Unmeta::registry() const {
    return impl_->registry;
}

} // namespace unmeta
