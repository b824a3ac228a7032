#include <Plm/Core/DynamicLibrary.hpp>

#ifdef _WIN32
  #include <windows.h> // LoadLibraryA, GetProcAddress, FreeLibrary
#else
  #include <dlfcn.h> // dlopen, dlsym, dlclose
#endif

#include <Plm/Utils/Logging.hpp>

namespace plm::core::plugin {
  using namespace utils::types;

  namespace {
#ifdef _WIN32
    using DynamicLibraryHandle = HMODULE;
#else
    using DynamicLibraryHandle = void*;
#endif

    using CreatePluginFunc   = IPlugin* (*)();
    using DestroyPluginFunc  = void (*)(IPlugin*);
    using SetLogLevelPtrFunc = void (*)(utils::logging::LogLevel*);
    using GetPluginNameFunc  = const char* (*)();

    fn OpenLibrary(const std::filesystem::path& path) -> Result<DynamicLibraryHandle> {
#ifdef _WIN32
      HMODULE handle = LoadLibraryA(path.string().c_str());
      if (!handle)
        ERR_FMT(LoadFailed, "Failed to load DLL '{}': Error Code {}", path.string(), GetLastError());
#else
      void* handle = dlopen(path.string().c_str(), RTLD_LAZY | RTLD_LOCAL);
      if (!handle)
        ERR_FMT(LoadFailed, "Failed to load shared library '{}': {}", path.string(), dlerror());
#endif

      return handle;
    }

    fn CloseLibrary(DynamicLibraryHandle handle) -> Unit {
      if (handle)
#ifdef _WIN32
        FreeLibrary(handle);
#else
        dlclose(handle);
#endif
    }

    template <typename Func>
    fn LookupSymbol(DynamicLibraryHandle handle, PCStr name) -> Result<Func> {
#ifdef _WIN32
      FARPROC func = GetProcAddress(handle, name);
#else
      void* func = dlsym(handle, name);
#endif
      if (!func)
        ERR_FMT(LoadFailed, "Failed to find '{}' function in plugin.", name);

      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      return reinterpret_cast<Func>(func);
    }
  } // namespace

  fn LoadDynamicPlugin(const std::filesystem::path& path, const StringView expectedName) -> Result<SharedPointer<IPlugin>> {
    debug_log("Loading plugin library '{}'", path.string());

    DynamicLibraryHandle handle = TRY(OpenLibrary(path));

    const Result<CreatePluginFunc>  createFunc  = LookupSymbol<CreatePluginFunc>(handle, "CreatePlugin");
    const Result<DestroyPluginFunc> destroyFunc = LookupSymbol<DestroyPluginFunc>(handle, "DestroyPlugin");

    if (!createFunc || !destroyFunc) {
      CloseLibrary(handle);
      return Err(createFunc ? destroyFunc.error() : createFunc.error());
    }

    if (const Result<GetPluginNameFunc> getName = LookupSymbol<GetPluginNameFunc>(handle, "GetPluginName")) {
      const PCStr provided = (*getName)();

      if (!provided || expectedName != provided) {
        CloseLibrary(handle);
        ERR_FMT(LoadFailed, "'{}' provides plugin '{}', not '{}'", path.string(), provided ? provided : "", expectedName);
      }
    }

    if (const Result<SetLogLevelPtrFunc> setLogLevel = LookupSymbol<SetLogLevelPtrFunc>(handle, "SetPluginLogLevelPtr"))
      (*setLogLevel)(utils::logging::GetLogLevelPtr());

    IPlugin* instance = nullptr;

    try {
      instance = (*createFunc)();
    } catch (const Exception& e) {
      CloseLibrary(handle);
      ERR_FMT(LoadFailed, "CreatePlugin in '{}' threw: {}", path.string(), e.what());
    }

    if (!instance) {
      CloseLibrary(handle);
      ERR_FMT(LoadFailed, "Failed to create instance from '{}'", path.string());
    }

    return SharedPointer<IPlugin>(instance, [destroy = *destroyFunc, handle](IPlugin* plugin) {
      destroy(plugin);
      CloseLibrary(handle);
    });
  }
} // namespace plm::core::plugin
