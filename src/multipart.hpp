#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace kindling {

using FormFields = std::vector<std::pair<std::string, std::string>>;

// Layout of a multipart/form-data request carrying one file. The text parts
// and the file part header form the preamble, the closing boundary the
// epilogue; the file bytes go in between and are never held in memory here.
class MultipartBody {
public:
    MultipartBody(const std::string& field, const std::string& file_path,
                  uint64_t file_size, const FormFields& fields = {},
                  std::string boundary = {});

    const std::string& boundary() const { return boundary_; }
    const std::string& preamble() const { return preamble_; }
    const std::string& epilogue() const { return epilogue_; }
    uint64_t file_size() const { return file_size_; }

    // Value for the Content-Type request header
    std::string content_type() const;

    uint64_t content_length() const;

private:
    std::string boundary_;
    std::string preamble_;
    std::string epilogue_;
    uint64_t file_size_;
};

// MIME type from the file extension, application/octet-stream if unknown
std::string guess_content_type(const std::string& file_path);

} // namespace kindling
