#include <mxpack/build/fetcher.hpp>
#include <mxpack/log.hpp>

namespace fs = std::filesystem;

namespace mxpack {

std::string url_file_name(const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));
    while (!path.empty() && path.back() == '/') path.pop_back();
    auto slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

bool is_zip_archive(const fs::path& archive) {
    auto ext = archive.extension().string();
    return ext == ".zip" || ext == ".mda";
}

Status CommandFetcher::download(const std::string& url, const fs::path& dest_file) {
    std::error_code ec;
    fs::create_directories(dest_file.parent_path(), ec);
    if (ec) {
        return PackError{PackError::IO,
            "cannot create download directory " + dest_file.parent_path().string() +
            ": " + ec.message()};
    }

    fs::path part = dest_file;
    part += ".part";
    fs::remove(part, ec);

    log::debug("downloading %s -> %s", url.c_str(), dest_file.c_str());
    Command cmd;
    cmd.args = {"curl", "--fail", "--location", "--silent", "--show-error",
                "--retry", "3", "--connect-timeout", "30",
                "--output", part.string(), url};
    cmd.timeout_seconds = timeout_seconds_;

    auto r = runner_.run(cmd);
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code != 0) {
        fs::remove(part, ec);
        return PackError{PackError::Network,
            "download of " + url + " failed (curl exit " +
            std::to_string(r.value().exit_code) + "): " + r.value().stderr_str};
    }

    fs::rename(part, dest_file, ec);
    if (ec) {
        return PackError{PackError::IO,
            "cannot move download into place at " + dest_file.string() + ": " + ec.message()};
    }
    return ok_status();
}

Status CommandFetcher::unpack(const fs::path& archive, const fs::path& dest_dir,
                              int strip_components) {
    std::error_code ec;
    fs::create_directories(dest_dir, ec);
    if (ec) {
        return PackError{PackError::IO,
            "cannot create " + dest_dir.string() + ": " + ec.message()};
    }

    Command cmd;
    cmd.timeout_seconds = timeout_seconds_;
    if (is_zip_archive(archive)) {
        cmd.args = {"unzip", "-oq", archive.string(), "-d", dest_dir.string()};
    } else {
        cmd.args = {"tar", "-xf", archive.string(), "-C", dest_dir.string()};
        if (strip_components > 0) {
            cmd.args.push_back("--strip-components=" + std::to_string(strip_components));
        }
    }

    log::debug("unpacking %s -> %s", archive.c_str(), dest_dir.c_str());
    auto r = runner_.run(cmd);
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code != 0) {
        return PackError{PackError::IO,
            "unpacking " + archive.string() + " failed: " + r.value().stderr_str};
    }
    return ok_status();
}

} // namespace mxpack
