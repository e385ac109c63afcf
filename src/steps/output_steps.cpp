// EN: Steps that produce the site: static copy, rendering and page persistence.
// FR: Étapes qui produisent le site : copie statique, rendu et écriture des pages.

#include "steps/builtin_steps.hpp"
#include "steps/step_helpers.hpp"
#include "infrastructure/system/build_errors.hpp"
#include "orchestrator/builder.hpp"
#include "orchestrator/version_resolver.hpp"

#include <memory>
#include <system_error>

namespace PSB {
namespace Steps {

namespace {

std::filesystem::path outputDirectory(const SiteConfig& config) {
    return config.getDestinationDir() / config.getString("output.dir", "_site");
}

} // namespace

void StaticCopy::init(const BuildOptions& options) {
    AbstractStep::init(options);
    std::error_code ec;
    can_process_ = !options.isDryRun() &&
                   std::filesystem::is_directory(config_.getSourcePath("static.dir"), ec);
}

void StaticCopy::process() {
    const auto output_dir = outputDirectory(config_);
    std::size_t copied = 0;

    for (const auto& [output_path, file] : builder_.getStatic()) {
        const auto target = output_dir / output_path;
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (!ec) {
            std::filesystem::copy_file(file.source_path, target,
                                       std::filesystem::copy_options::overwrite_existing, ec);
        }
        if (ec) {
            throw BuildError("Unable to copy '" + file.source_path.string() + "': " + ec.message());
        }
        ++copied;
    }

    logger_.info("static.copy", std::to_string(copied) + " file(s) copied",
                 {{"dir", output_dir.string()}});
}

void PagesRender::process() {
    if (!builder_.getContext().hasRenderer()) {
        builder_.setRenderer(std::make_shared<Content::PlaceholderRenderer>());
    }
    auto& renderer = builder_.getRenderer();

    nlohmann::json site = {
        {"title", config_.getString("title")},
        {"baseurl", config_.getString("baseurl")},
        {"language", config_.getString("language", "en")},
        {"version", Orchestrator::VersionResolver::getInstance().getVersion()},
        {"data", nlohmann::json::object()}
    };
    for (const auto& [name, dataset] : builder_.getData()) {
        site["data"][name] = dataset;
    }

    std::size_t rendered = 0;
    for (auto& page : builder_.getPages()) {
        page.output = renderer.render(page, site);
        ++rendered;
    }

    logger_.info("pages.render", std::to_string(rendered) + " page(s) rendered",
                 {{"renderer", renderer.getName()}});
}

void PagesSave::init(const BuildOptions& options) {
    AbstractStep::init(options);
    can_process_ = !options.isDryRun();
}

void PagesSave::process() {
    const auto output_dir = outputDirectory(config_);
    const std::string extension = config_.getString("output.ext", "html");
    std::size_t saved = 0;

    for (auto& page : builder_.getPages()) {
        if (page.output_path.empty()) {
            page.output_path = outputPathFor(page, extension);
        }
        writeTextFile(output_dir / page.output_path, page.output);
        logger_.debug("pages.save", page.output_path, {{"page", page.id}});
        ++saved;
    }

    logger_.info("pages.save", std::to_string(saved) + " page(s) saved",
                 {{"dir", output_dir.string()}});
}

} // namespace Steps
} // namespace PSB
