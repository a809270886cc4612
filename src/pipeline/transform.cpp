#include "hirespipe/pipeline/transform.hpp"

#include "hirespipe/config/configuration.hpp"
#include "hirespipe/core/errors.hpp"
#include "hirespipe/core/utils.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <system_error>

#include <sys/wait.h>
#include <unistd.h>

namespace hirespipe::pipeline {

namespace {

constexpr int kExitDataErr = 65; // sysexits.h EX_DATAERR

fs::path apply_suffix(const fs::path& relative, const std::string& suffix) {
    if (suffix.empty()) {
        return relative;
    }
    fs::path out = relative.parent_path();
    out /= relative.stem().string() + suffix + relative.extension().string();
    return out;
}

void replace_all(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

fs::path TransformAdapter::output_name(const fs::path& relative_input) const {
    return relative_input;
}

PassthroughTransform::PassthroughTransform(std::string output_suffix)
    : output_suffix_(std::move(output_suffix)) {}

TransformResult PassthroughTransform::transform(const fs::path& input) {
    std::error_code ec;
    if (!fs::is_regular_file(input, ec)) {
        return TransformResult::failure(ErrorKind::InvalidInput,
                                        "not a regular file: " + input.string());
    }
    try {
        return TransformResult::success(core::read_bytes(input));
    } catch (const IOError& e) {
        return TransformResult::failure(ErrorKind::TransientFailure, e.what());
    }
}

fs::path PassthroughTransform::output_name(const fs::path& relative_input) const {
    return apply_suffix(relative_input, output_suffix_);
}

CommandTransform::CommandTransform(std::string command_template, fs::path scratch_dir,
                                   std::string output_suffix)
    : command_template_(std::move(command_template)),
      scratch_dir_(std::move(scratch_dir)),
      output_suffix_(std::move(output_suffix)) {}

std::string CommandTransform::render_command(const fs::path& input, const fs::path& output) const {
    std::string cmd = command_template_;
    replace_all(cmd, "{input}", core::shell_quote(input.string()));
    replace_all(cmd, "{output}", core::shell_quote(output.string()));
    return cmd;
}

TransformResult CommandTransform::transform(const fs::path& input) {
    static std::atomic<unsigned long> seq{0};

    std::error_code ec;
    if (!fs::is_regular_file(input, ec)) {
        return TransformResult::failure(ErrorKind::InvalidInput,
                                        "not a regular file: " + input.string());
    }

    fs::create_directories(scratch_dir_, ec);
    if (ec) {
        return TransformResult::failure(ErrorKind::TransientFailure,
                                        "cannot create scratch dir " + scratch_dir_.string() +
                                            ": " + ec.message());
    }

    fs::path out = scratch_dir_ / ("out." + std::to_string(::getpid()) + "." +
                                   std::to_string(seq.fetch_add(1)) +
                                   input.extension().string());
    const std::string cmd = render_command(input, out);
    std::cerr << "[TRANSFORM] Running: " << cmd << std::endl;

    const int status = std::system(cmd.c_str());

    TransformResult result;
    if (status == -1) {
        result = TransformResult::failure(ErrorKind::TransientFailure, "cannot spawn shell");
    } else if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        try {
            result = TransformResult::success(core::read_bytes(out));
        } catch (const IOError& e) {
            result = TransformResult::failure(ErrorKind::TransientFailure,
                                              std::string("command produced no output: ") + e.what());
        }
    } else if (WIFEXITED(status) && WEXITSTATUS(status) == kExitDataErr) {
        result = TransformResult::failure(ErrorKind::InvalidInput,
                                          "command rejected input (exit 65)");
    } else {
        const int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        result = TransformResult::failure(ErrorKind::TransientFailure,
                                          "command failed with exit code " + std::to_string(code));
    }

    fs::remove(out, ec);
    return result;
}

fs::path CommandTransform::output_name(const fs::path& relative_input) const {
    return apply_suffix(relative_input, output_suffix_);
}

std::unique_ptr<TransformAdapter> make_transform(const config::Config& cfg) {
    if (cfg.transform == "command") {
        return std::make_unique<CommandTransform>(
            cfg.transform_command, fs::temp_directory_path() / "hirespipe-scratch",
            cfg.output_suffix);
    }
    if (cfg.transform == "passthrough") {
        return std::make_unique<PassthroughTransform>(cfg.output_suffix);
    }
    throw ConfigError("unknown transform: " + cfg.transform);
}

} // namespace hirespipe::pipeline
