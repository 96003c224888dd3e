#pragma once
#include <expected>
#include <string>

namespace clip_service {
class TranscodingService {
public:
  virtual ~TranscodingService() = default;
  // Blocks until the output file is written or the attempt has failed.
  virtual std::expected<void, std::string> transcode(
    const std::string& input_path,
    const std::string& output_path
  ) = 0;
};
}
