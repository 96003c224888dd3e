// subprocess_transcoder.cpp
#include "subprocess_transcoder.hpp"
#include <iostream>
#include <boost/filesystem/operations.hpp>
#include <boost/process.hpp>

namespace bp = boost::process;

namespace clip_service {

SubprocessTranscoder::SubprocessTranscoder(const config::TranscodeConfig& config)
    : config_(config), executable_(resolveExecutable(config.ffmpeg_path)) {
  if (executable_.empty()) {
    std::cerr << "[Transcoder] " << config_.ffmpeg_path
              << " is not installed or not found in PATH" << std::endl;
  } else {
    std::cout << "[Transcoder] Using " << executable_.string() << std::endl;
  }
}

boost::filesystem::path SubprocessTranscoder::resolveExecutable(const std::string& name) {
  if (name.empty()) {
    return {};
  }
  // explicit paths are used as given, bare names are looked up in PATH
  if (name.find('/') != std::string::npos) {
    boost::system::error_code ec;
    boost::filesystem::path path(name);
    return boost::filesystem::is_regular_file(path, ec) ? path : boost::filesystem::path{};
  }
  return bp::search_path(name);
}

std::vector<std::string> SubprocessTranscoder::buildArguments(const std::string& input_path,
                                                              const std::string& output_path) const {
  std::vector<std::string> args = {
    "-y", "-hide_banner", "-loglevel", "error",
    "-i", input_path,
    "-c:v", config_.video_codec,
    "-crf", std::to_string(config_.crf),
  };
  if (!config_.preset.empty()) {
    args.push_back("-preset");
    args.push_back(config_.preset);
  }
  args.push_back(output_path);
  return args;
}

std::expected<void, std::string> SubprocessTranscoder::transcode(
    const std::string& input_path,
    const std::string& output_path) {
  if (executable_.empty()) {
    return std::unexpected(config_.ffmpeg_path + " is not installed or not found in PATH");
  }

  try {
    bp::child ffmpeg(bp::exe = executable_.string(),
                     bp::args = buildArguments(input_path, output_path),
                     bp::std_in < bp::null,
                     bp::std_out > bp::null,
                     bp::std_err > bp::null);
    ffmpeg.wait();

    int code = ffmpeg.exit_code();
    if (code != 0) {
      return std::unexpected("FFmpeg command failed with code: " + std::to_string(code));
    }
    return {};
  } catch (const bp::process_error& e) {
    return std::unexpected("Failed to launch " + executable_.string() + ": " + e.what());
  }
}

} // namespace clip_service
