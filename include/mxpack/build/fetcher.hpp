#pragma once

#include <mxpack/process.hpp>
#include <mxpack/result.hpp>
#include <filesystem>
#include <string>

namespace mxpack {

// Retrieval and unpacking of remote archives
class ArtifactFetcher {
public:
    virtual ~ArtifactFetcher() = default;

    // Populate dest_file with the body of url, or fail. dest_file is only
    // created once the transfer completed.
    virtual Status download(const std::string& url,
                            const std::filesystem::path& dest_file) = 0;

    // Extract archive into dest_dir (created when missing), dropping the
    // first strip_components path elements of tar entries.
    virtual Status unpack(const std::filesystem::path& archive,
                          const std::filesystem::path& dest_dir,
                          int strip_components = 0) = 0;
};

// Fetcher backed by the curl, tar and unzip command line tools
class CommandFetcher : public ArtifactFetcher {
public:
    explicit CommandFetcher(ProcessRunner& runner) : runner_(runner) {}

    Status download(const std::string& url,
                    const std::filesystem::path& dest_file) override;
    Status unpack(const std::filesystem::path& archive,
                  const std::filesystem::path& dest_dir,
                  int strip_components = 0) override;

    void set_timeout(int seconds) { timeout_seconds_ = seconds; }

private:
    ProcessRunner& runner_;
    int timeout_seconds_ = 1800;
};

// File name of the last path segment of a URL, without query or fragment
std::string url_file_name(const std::string& url);

// true for archives unpacked with unzip (.zip, .mda)
bool is_zip_archive(const std::filesystem::path& archive);

} // namespace mxpack
