//
// Created by Giuseppe Francione on 02/02/26.
//

#include "../../include/parser.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"

namespace fs = std::filesystem;

namespace unmeta {

namespace {

    bool is_safe_first_char(const char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '.' || c == '/';
    }

} // namespace

std::string_view state_to_string(const Parser::State state) noexcept {
    switch (state) {
        case Parser::State::Constructed:      return "Constructed";
        case Parser::State::InPlaceRequested: return "InPlaceRequested";
        case Parser::State::Cleaned:          return "Cleaned";
        case Parser::State::Failed:           return "Failed";
        case Parser::State::Swapped:          return "Swapped";
    }
    return "";
}

fs::path Parser::sanitize(const fs::path& filename) {
    const std::string raw = filename.string();
    if (raw.empty() || is_safe_first_char(raw.front())) {
        return filename;
    }
    // external tools must never see this as a flag or an absolute path
    return fs::path(".") / filename;
}

fs::path Parser::derive_output_filename(const fs::path& filename) {
    const std::string raw = filename.string();
    const std::string ext = filename.extension().string();
    return fs::path(raw.substr(0, raw.size() - ext.size()) + ".cleaned" + ext);
}

Parser::Parser(const fs::path& filename) {
    const std::string raw = filename.string();
    if (raw.empty()) {
        throw InvalidInputError("Empty filename");
    }
    if (raw.find('\0') != std::string::npos) {
        throw InvalidInputError("Filename contains a NUL byte");
    }

    filename_ = sanitize(filename);

    const auto leaf = filename_.filename();
    if (leaf.empty() || leaf == "." || leaf == "..") {
        throw InvalidInputError("Not a file reference: " + raw);
    }

    output_filename_ = derive_output_filename(filename_);
}

Parser::~Parser() {
    if (!finalized_) {
        finalize();
    }
}

void Parser::set_edit_in_place() {
    if (finalized_ || state_ != State::Constructed) {
        throw StateError("set_edit_in_place() not allowed in state " +
                         std::string(state_to_string(state_)) + " for " + filename_.string());
    }

    // external tools may dispatch on the extension, so the temp file keeps it
    std::error_code ec;
    auto temp = make_temp_file(filename_.extension().string(), "inplace", ec);
    if (ec) {
        throw CleaningError("Cannot create a temporary file for " + filename_.string() + ": " + ec.message());
    }

    output_filename_ = std::move(temp);
    in_place_ = true;
    state_ = State::InPlaceRequested;
    Logger::log(LogLevel::Debug, "In-place editing of " + filename_.string() +
                " through " + output_filename_.string(), "parser");
}

bool Parser::remove_all() {
    if (finalized_ || (state_ != State::Constructed && state_ != State::InPlaceRequested)) {
        throw StateError("remove_all() not allowed in state " +
                         std::string(state_to_string(state_)) + " for " + filename_.string());
    }

    Logger::log(LogLevel::Info,
                std::string(lightweight_cleaning_ ? "Lightweight" : "Thorough") + " cleaning of " +
                filename_.string() + " into " + output_filename_.string(), "parser");

    // a partial non in-place output is dropped here, an in-place temp by finalize()
    auto discard_output = [this] {
        state_ = State::Failed;
        if (!in_place_) {
            std::error_code ec;
            remove_file_logged(output_filename_, ec, "parser");
        }
    };

    bool ok = false;
    try {
        ok = lightweight_cleaning_ ? remove_all_lightweight() : remove_all_thorough();
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, "Cleaning of " + filename_.string() + " failed: " + e.what(), "parser");
        discard_output();
        throw;
    }

    if (!ok) {
        Logger::log(LogLevel::Error, "Cleaning of " + filename_.string() + " reported failure", "parser");
        discard_output();
        return false;
    }

    state_ = State::Cleaned;
    Logger::log(LogLevel::Info, "Cleaned " + filename_.string(), "parser");
    return true;
}

SwapReport Parser::finalize() noexcept {
    if (finalized_) {
        return report_;
    }
    finalized_ = true;

    if (!in_place_) {
        return report_;
    }

    report_.status = SwapReport::Status::NotCleaned;
    if (state_ == State::Cleaned) {
        std::error_code ec;
        // keep the original's permission bits, the temp file was created private
        const auto original_status = fs::status(filename_, ec);
        if (!ec) {
            fs::permissions(output_filename_, original_status.permissions(), ec);
            if (ec) {
                Logger::log(LogLevel::Debug, "Cannot copy permissions onto " + output_filename_.string() +
                            " (" + ec.message() + ")", "parser");
            }
        }

        ec.clear();
        move_over_original(output_filename_, filename_, ec);
        if (!ec) {
            state_ = State::Swapped;
            report_.status = SwapReport::Status::Swapped;
            report_.original_untouched = false;
            Logger::log(LogLevel::Info, "Replaced " + filename_.string() + " with its cleaned version", "parser");
            return report_;
        }
        report_.reason = ec.message();
    } else {
        report_.reason = "cleaning did not complete (state " + std::string(state_to_string(state_)) + ")";
    }

    Logger::log(LogLevel::Error, filename_.string() + " was NOT cleaned: " + report_.reason, "parser");

    std::error_code rm_ec;
    if (!remove_file_logged(output_filename_, rm_ec, "parser")) {
        report_.temp_removed = false;
        report_.cleanup_error = rm_ec.message();
        Logger::log(LogLevel::Error, "Could not remove temporary file " + output_filename_.string() +
                    ": " + report_.cleanup_error, "parser");
    }
    return report_;
}

void Parser::move_over_original(const fs::path& from, const fs::path& to, std::error_code& ec) noexcept {
    ec.clear();
    fs::rename(from, to, ec);
    if (ec != std::errc::cross_device_link) {
        return;
    }

    Logger::log(LogLevel::Debug, "Cross-device move of " + from.string() + ", staging beside " + to.string(),
                "parser");
    const auto staging = make_staging_path_beside(to);
    ec.clear();
    fs::copy_file(from, staging, fs::copy_options::overwrite_existing, ec);
    if (!ec) {
        fs::rename(staging, to, ec);
    }
    if (ec) {
        std::error_code staging_ec;
        remove_file_logged(staging, staging_ec, "parser");
        return;
    }

    std::error_code rm_ec;
    remove_file_logged(from, rm_ec, "parser");
}

} // namespace unmeta
