/**
 * @file sample_tool.cpp
 * @brief Sample tool plugin for Plm
 * @author Plm Team
 * @version 1.0.0
 *
 * @details Installs a "tool" by writing a stamp file under the project root:
 *
 *   <project root>/<install_dir>/<version>/INSTALLED
 *
 * install_dir comes from the plugin's config payload and defaults to
 * ".plm/sample-tool". Uninstalling removes the version directory.
 *
 * This file supports both dynamic (shared library) and static compilation.
 * When compiled as a static plugin (PLM_STATIC_PLUGIN_BUILD defined), it
 * registers itself in the static catalog instead of exporting extern "C"
 * entry points.
 */

#include <filesystem>
#include <format>
#include <fstream>
#include <system_error>

#include <Plm/Core/Plugin.hpp>

#include <Plm/Utils/Error.hpp>
#include <Plm/Utils/Logging.hpp>
#include <Plm/Utils/Types.hpp>

namespace {
  using namespace plm::utils::types;

  namespace fs = std::filesystem;

  constexpr PCStr DEFAULT_INSTALL_DIR = ".plm/sample-tool";

  class SampleToolPlugin : public plm::core::plugin::IPlugin {
   private:
    plm::core::plugin::PluginMetadata m_metadata;
    fs::path                          m_installRoot;
    bool                              m_ready = false;

    [[nodiscard]] fn versionDir(const String& version) const -> fs::path {
      return m_installRoot / version;
    }

   public:
    SampleToolPlugin() {
      m_metadata = {
        .name        = "sample-tool",
        .version     = "1.0.0",
        .description = "Writes a stamp file per installed version",
        .author      = "Plm Team",
      };
    }

    [[nodiscard]] fn getMetadata() const -> const plm::core::plugin::PluginMetadata& override {
      return m_metadata;
    }

    fn initialize(const plm::core::plugin::PluginContext& ctx) -> Result<Unit> override {
      String installDir = DEFAULT_INSTALL_DIR;

      if (ctx.config && ctx.config->payload.is_object()) {
        const auto& payload = ctx.config->payload.get<glz::json_t::object_t>();

        if (const auto iter = payload.find("install_dir"); iter != payload.end()) {
          if (!iter->second.is_string())
            ERR(InvalidArgument, "install_dir must be a string");

          installDir = iter->second.get<String>();
        }
      }

      m_installRoot = ctx.projectRoot / installDir;
      m_ready       = true;

      debug_log("sample-tool installs into {}", m_installRoot.string());

      return {};
    }

    fn shutdown() -> Result<Unit> override {
      m_ready = false;
      return {};
    }

    fn install(const String& version, const plm::core::plugin::InstallOptions& options) -> Result<String> override {
      if (!m_ready)
        ERR(InvalidState, "sample-tool is not initialized");

      const fs::path target = versionDir(version);
      const fs::path stamp  = target / "INSTALLED";

      std::error_code errc;

      if (fs::exists(stamp, errc) && !options.force)
        ERR_FMT(InvalidState, "sample-tool {} is already present in {}", version, target.string());

      fs::create_directories(target, errc);

      if (errc)
        ERR_FMT(InternalError, "Failed to create {}: {}", target.string(), errc.message());

      std::ofstream file(stamp, std::ios::trunc);

      if (!file)
        ERR_FMT(InternalError, "Failed to write {}", stamp.string());

      file << version << '\n';

      if (options.verbose)
        info_log("sample-tool wrote {}", stamp.string());

      return stamp.string();
    }

    fn uninstall(const String& version) -> Result<Unit> override {
      if (!m_ready)
        ERR(InvalidState, "sample-tool is not initialized");

      std::error_code errc;

      fs::remove_all(versionDir(version), errc);

      if (errc)
        ERR_FMT(InternalError, "Failed to remove {}: {}", versionDir(version).string(), errc.message());

      return {};
    }
  };
} // namespace

PLM_PLUGIN(SampleToolPlugin, "sample-tool")
