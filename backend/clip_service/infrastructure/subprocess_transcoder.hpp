// subprocess_transcoder.hpp
#pragma once

#include "domain/transcoding_service.hpp"
#include "common/config/config.hpp"

#include <string>
#include <expected>
#include <vector>
#include <boost/filesystem/path.hpp>

namespace clip_service {

// Runs one ffmpeg process per call and waits for it. Arguments are passed as
// an argv vector, no shell is involved.
class SubprocessTranscoder : public TranscodingService {
public:
  explicit SubprocessTranscoder(const config::TranscodeConfig& config);
  ~SubprocessTranscoder() override = default;

  std::expected<void, std::string> transcode(
    const std::string& input_path,
    const std::string& output_path
  ) override;

  bool isAvailable() const { return !executable_.empty(); }
  const boost::filesystem::path& executable() const { return executable_; }

  std::vector<std::string> buildArguments(const std::string& input_path,
                                          const std::string& output_path) const;

private:
  static boost::filesystem::path resolveExecutable(const std::string& name);

  config::TranscodeConfig config_;
  boost::filesystem::path executable_;
};

} // namespace clip_service
