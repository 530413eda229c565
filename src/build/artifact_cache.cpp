#include <mxpack/build/artifact_cache.hpp>
#include <mxpack/log.hpp>

namespace fs = std::filesystem;

namespace mxpack {

const char* acquire_source_name(AcquireSource s) {
    switch (s) {
        case AcquireSource::BaseImage: return "base image";
        case AcquireSource::ForcedUrl: return "forced url";
        case AcquireSource::Blobstore: return "blobstore";
    }
    return "unknown";
}

namespace {

struct AcquireInputs {
    bool prebaked_exists;
    bool forced_url_set;
};

struct AcquireRule {
    AcquireSource source;
    bool (*applies)(const AcquireInputs&);
};

// First matching row wins
const AcquireRule ACQUIRE_RULES[] = {
    {AcquireSource::BaseImage, [](const AcquireInputs& in) { return in.prebaked_exists; }},
    {AcquireSource::ForcedUrl, [](const AcquireInputs& in) { return in.forced_url_set; }},
    {AcquireSource::Blobstore, [](const AcquireInputs&) { return true; }},
};

bool non_empty_file(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec) && fs::file_size(p, ec) > 0 && !ec;
}

bool non_empty_dir(const fs::path& p) {
    std::error_code ec;
    return fs::is_directory(p, ec) && !fs::is_empty(p, ec) && !ec;
}

} // namespace

ArtifactCache::ArtifactCache(const BuildContext& ctx, ArtifactFetcher& fetcher)
    : ctx_(ctx), fetcher_(fetcher) {}

std::optional<std::string> ArtifactCache::forced_url_for(const std::string& name) const {
    if (name == component::RUNTIME) return ctx_.settings.forced_runtime_url;
    if (name == component::COMPILER) return ctx_.settings.forced_compiler_url;
    return std::nullopt;
}

TemplateVars ArtifactCache::template_vars(const ComponentSpec& spec,
                                          const std::string& version) const {
    TemplateVars vars = spec.vars;
    vars["version"] = version;
    vars["toolchain"] = ctx_.runtime_version.to_string();
    vars["stack"] = ctx_.settings.stack;
    return vars;
}

fs::path ArtifactCache::cache_entry_path(const std::string& component,
                                         const std::string& version,
                                         const std::string& archive) const {
    return ctx_.paths.cache_dir / component / version / archive;
}

Result<AcquirePlan> ArtifactCache::plan(const std::string& component,
                                        const std::string& version,
                                        const fs::path& destination) const {
    auto spec_r = ctx_.dependencies.component(component);
    if (spec_r.is_err()) return std::move(spec_r).error();
    const ComponentSpec& spec = *spec_r.value();
    TemplateVars vars = template_vars(spec, version);

    fs::path prebaked;
    if (!spec.prebaked.empty()) {
        auto rel = expand_template(spec.prebaked, vars);
        if (rel.is_err()) return std::move(rel).error();
        prebaked = ctx_.paths.base_image_root / rel.value();
    }

    auto forced = forced_url_for(component);
    AcquireInputs inputs{!prebaked.empty() && non_empty_dir(prebaked), forced.has_value()};

    AcquirePlan p;
    p.component = component;
    p.version = version;
    for (const auto& rule : ACQUIRE_RULES) {
        if (rule.applies(inputs)) {
            p.source = rule.source;
            break;
        }
    }

    switch (p.source) {
    case AcquireSource::BaseImage:
        p.location = prebaked;
        break;

    case AcquireSource::ForcedUrl:
        p.url = *forced;
        p.archive_path = ctx_.throwaway_cache_dir() / component / url_file_name(p.url);
        p.location = destination;
        break;

    case AcquireSource::Blobstore: {
        std::string archive;
        if (!spec.archive.empty()) {
            auto a = expand_template(spec.archive, vars);
            if (a.is_err()) return std::move(a).error();
            archive = a.value();
        }
        if (!spec.url.empty()) {
            auto u = expand_template(spec.url, vars);
            if (u.is_err()) return std::move(u).error();
            p.url = u.value();
            if (archive.empty()) archive = url_file_name(p.url);
        } else {
            p.url = ctx_.dependencies.blobstore_url + "/" + archive;
        }
        p.archive_path = cache_entry_path(component, version, archive);
        p.location = destination;
        break;
    }
    }

    return Result<AcquirePlan>::ok(std::move(p));
}

Result<fs::path> ArtifactCache::ensure(const std::string& component,
                                       const std::string& version,
                                       const fs::path& destination) {
    auto plan_r = plan(component, version, destination);
    if (plan_r.is_err()) return std::move(plan_r).error();
    const AcquirePlan& p = plan_r.value();

    log::debug("%s %s: %s", component.c_str(), version.c_str(),
               acquire_source_name(p.source));

    if (p.source == AcquireSource::BaseImage) {
        log::info("using %s %s from the base image at %s",
                  component.c_str(), version.c_str(), p.location.c_str());
        return Result<fs::path>::ok(p.location);
    }

    if (non_empty_file(p.archive_path)) {
        log::debug("cache hit: %s", p.archive_path.c_str());
    } else {
        log::info("downloading %s %s from %s", component.c_str(), version.c_str(), p.url.c_str());
        auto d = fetcher_.download(p.url, p.archive_path);
        if (d.is_err()) {
            auto e = std::move(d).error();
            return PackError{PackError::Artifact,
                "cannot download " + component + " " + version + ": " + e.message,
                e.hint};
        }
    }

    auto spec = ctx_.dependencies.component(component);
    int strip = spec.is_ok() ? spec.value()->strip_components : 0;
    auto u = fetcher_.unpack(p.archive_path, p.location, strip);
    if (u.is_err()) {
        auto e = std::move(u).error();
        return PackError{PackError::Artifact,
            "cannot unpack " + component + " " + version + ": " + e.message};
    }

    return Result<fs::path>::ok(p.location);
}

Result<std::string> ArtifactCache::version_for(const std::string& component) const {
    auto spec = ctx_.dependencies.component(component);
    if (spec.is_err()) return std::move(spec).error();
    return spec.value()->select_version(ctx_.runtime_version);
}

Result<fs::path> ArtifactCache::install_path(const std::string& component) const {
    auto spec = ctx_.dependencies.component(component);
    if (spec.is_err()) return std::move(spec).error();
    auto version = version_for(component);
    if (version.is_err()) return std::move(version).error();

    auto rel = expand_template(spec.value()->install, template_vars(*spec.value(), version.value()));
    if (rel.is_err()) return std::move(rel).error();
    return Result<fs::path>::ok(ctx_.paths.build_dir / rel.value());
}

Result<fs::path> ArtifactCache::ensure(const std::string& component) {
    auto version = version_for(component);
    if (version.is_err()) return std::move(version).error();
    auto dest = install_path(component);
    if (dest.is_err()) return std::move(dest).error();
    return ensure(component, version.value(), dest.value());
}

} // namespace mxpack
