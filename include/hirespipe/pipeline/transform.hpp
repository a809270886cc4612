#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace hirespipe::config {
struct Config;
}

namespace hirespipe::pipeline {

namespace fs = std::filesystem;

enum class ErrorKind {
    None,
    InvalidInput,     // permanent, never retried
    TransientFailure  // retried with backoff
};

inline std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::InvalidInput: return "InvalidInput";
        case ErrorKind::TransientFailure: return "TransientFailure";
        default: return "Unknown";
    }
}

struct TransformResult {
    std::vector<uint8_t> bytes;
    ErrorKind error = ErrorKind::None;
    std::string message;

    bool ok() const { return error == ErrorKind::None; }

    static TransformResult success(std::vector<uint8_t> out) {
        TransformResult r;
        r.bytes = std::move(out);
        return r;
    }
    static TransformResult failure(ErrorKind kind, std::string msg) {
        TransformResult r;
        r.error = kind;
        r.message = std::move(msg);
        return r;
    }
};

/**
 * Boundary to the resolution-upgrade step. Implementations must be
 * deterministic for identical input bytes and must not modify the input.
 * They may be called from several workers at once.
 */
class TransformAdapter {
public:
    virtual ~TransformAdapter() = default;

    virtual TransformResult transform(const fs::path& input) = 0;

    virtual std::string name() const = 0;

    // Destination path relative to destDir for a source path relative to sourceDir.
    virtual fs::path output_name(const fs::path& relative_input) const;
};

// Returns the input unchanged: the plain 12 -> 70 promotion.
class PassthroughTransform : public TransformAdapter {
public:
    explicit PassthroughTransform(std::string output_suffix = "");

    TransformResult transform(const fs::path& input) override;
    std::string name() const override { return "passthrough"; }
    fs::path output_name(const fs::path& relative_input) const override;

private:
    std::string output_suffix_;
};

/**
 * Runs an external upscaler. The template's {input} and {output}
 * placeholders are replaced by shell-quoted paths; {output} is a fresh temp
 * file whose contents become the result. Exit status 65 (EX_DATAERR) marks
 * the input invalid, any other nonzero status is transient.
 */
class CommandTransform : public TransformAdapter {
public:
    CommandTransform(std::string command_template, fs::path scratch_dir,
                     std::string output_suffix = "");

    TransformResult transform(const fs::path& input) override;
    std::string name() const override { return "command"; }
    fs::path output_name(const fs::path& relative_input) const override;

    std::string render_command(const fs::path& input, const fs::path& output) const;

private:
    std::string command_template_;
    fs::path scratch_dir_;
    std::string output_suffix_;
};

std::unique_ptr<TransformAdapter> make_transform(const config::Config& cfg);

} // namespace hirespipe::pipeline
