#include <Plm/Core/PluginRegistry.hpp>
#include <Plm/Utils/Error.hpp>
#include <Plm/Utils/Types.hpp>

#include <chrono> // std::chrono_literals

#include "Support/MockPlugin.hpp"
#include "gtest/gtest.h"

using namespace testing;
using namespace std::chrono_literals;
using namespace plm::utils::types;

using plm::config::PluginConfig;
using plm::core::plugin::ContentionPolicy;
using plm::core::plugin::InstallOptions;
using plm::core::plugin::LifecycleState;
using plm::core::plugin::OperationGuard;
using plm::core::plugin::OperationOutcome;
using plm::core::plugin::OperationTrace;
using plm::core::plugin::PluginFailure;
using plm::core::plugin::PluginInfo;
using plm::core::plugin::PluginRegistry;
using plm::tests::MockPlugin;
using plm::utils::error::PlmErrorCode;

namespace {
  struct Transition {
    String         plugin;
    LifecycleState from;
    LifecycleState target;

    fn operator==(const Transition&) const -> bool = default;
  };
} // namespace

class PluginRegistryTest : public Test {
 protected:
  PluginRegistry            m_registry;
  SharedPointer<MockPlugin> m_alpha = std::make_shared<MockPlugin>("alpha");

  Mutex           m_transitionsMutex;
  Vec<Transition> m_transitions;

  fn SetUp() -> Unit override {
    m_registry.setStateObserver([this](const String& name, const LifecycleState from, const LifecycleState target) {
      const LockGuard lock(m_transitionsMutex);
      m_transitions.push_back({ name, from, target });
    });
  }

  fn transitions() -> Vec<Transition> {
    const LockGuard lock(m_transitionsMutex);
    return m_transitions;
  }

  fn install(const String& name, const String& version, const InstallOptions& options = {}) -> Result<OperationOutcome> {
    OperationGuard guard = TRY(m_registry.lockPlugin(name));
    OperationTrace trace(name, options.verbose);

    return m_registry.installLocked(guard, version, options, trace);
  }

  fn uninstall(const String& name, const String& version, const InstallOptions& options = {}) -> Result<OperationOutcome> {
    OperationGuard guard = TRY(m_registry.lockPlugin(name));
    OperationTrace trace(name, options.verbose);

    return m_registry.uninstallLocked(guard, version, options, trace);
  }

  fn registerAndInitialize(const SharedPointer<MockPlugin>& plugin) -> Unit {
    const String& name = plugin->getMetadata().name;

    ASSERT_TRUE(m_registry.registerPlugin(name, plugin).has_value());
    ASSERT_TRUE(m_registry.initializeOne(name).has_value());
  }
};

TEST_F(PluginRegistryTest, RegisterCreatesRegisteredEntry) {
  const Result<OperationOutcome> result = m_registry.registerPlugin("alpha", m_alpha);

  ASSERT_TRUE(result.has_value()) << result.error().message;
  EXPECT_EQ(result->previous, LifecycleState::Unregistered);
  EXPECT_EQ(result->current, LifecycleState::Registered);
  EXPECT_EQ(m_registry.stateOf("alpha"), LifecycleState::Registered);
  EXPECT_EQ(m_alpha->initializeCalls.load(), 0);
}

TEST_F(PluginRegistryTest, DuplicateActiveNameIsRejected) {
  ASSERT_TRUE(m_registry.registerPlugin("alpha", m_alpha).has_value());

  const Result<OperationOutcome> result = m_registry.registerPlugin("alpha", std::make_shared<MockPlugin>("alpha"));

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, PlmErrorCode::AlreadyRegistered);
  EXPECT_EQ(m_registry.activeCount(), 1);
}

TEST_F(PluginRegistryTest, RegisterRejectsBadArguments) {
  const Result<OperationOutcome> emptyName = m_registry.registerPlugin("", m_alpha);
  ASSERT_FALSE(emptyName.has_value());
  EXPECT_EQ(emptyName.error().code, PlmErrorCode::InvalidArgument);

  const Result<OperationOutcome> noImpl = m_registry.registerPlugin("alpha", nullptr);
  ASSERT_FALSE(noImpl.has_value());
  EXPECT_EQ(noImpl.error().code, PlmErrorCode::InvalidArgument);

  const Result<OperationOutcome> wrongConfig = m_registry.registerPlugin("alpha", m_alpha, PluginConfig::named("beta"));
  ASSERT_FALSE(wrongConfig.has_value());
  EXPECT_EQ(wrongConfig.error().code, PlmErrorCode::InvalidArgument);

  EXPECT_FALSE(m_registry.contains("alpha"));
}

TEST_F(PluginRegistryTest, ObserverSeesEveryLifecycleStep) {
  registerAndInitialize(m_alpha);

  ASSERT_TRUE(install("alpha", "1.0.0").has_value());
  ASSERT_TRUE(m_registry.shutdownOne("alpha").has_value());

  using enum LifecycleState;

  const Vec<Transition> expected {
    { "alpha", Unregistered, Registered },
    { "alpha", Registered, Initialized },
    { "alpha", Initialized, Installed },
    { "alpha", Installed, ShuttingDown },
    { "alpha", ShuttingDown, Shutdown },
  };

  EXPECT_EQ(transitions(), expected);
}

TEST_F(PluginRegistryTest, InitializePassesContextToPlugin) {
  PluginConfig config = PluginConfig::named("alpha", "1.0.0");
  config.payload      = glz::json_t { { "mode", "fast" } };

  m_registry.setProjectRoot("/work/project");
  ASSERT_TRUE(m_registry.registerPlugin("alpha", m_alpha, config).has_value());
  ASSERT_TRUE(m_registry.initializeOne("alpha").has_value());

  ASSERT_TRUE(m_alpha->lastContext.has_value());
  EXPECT_EQ(m_alpha->lastContext->name, "alpha");
  EXPECT_EQ(m_alpha->lastContext->projectRoot, std::filesystem::path("/work/project"));
  ASSERT_TRUE(m_alpha->lastContext->config.has_value());
  EXPECT_EQ(*m_alpha->lastContext->config, config);
}

TEST_F(PluginRegistryTest, InitializeFailureKeepsEntryRegistered) {
  m_alpha->failInitialize = true;
  ASSERT_TRUE(m_registry.registerPlugin("alpha", m_alpha).has_value());

  const Result<OperationOutcome> result = m_registry.initializeOne("alpha");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, PlmErrorCode::InitializationFailed);
  EXPECT_NE(result.error().message.find("initialize refused"), String::npos);
  EXPECT_EQ(m_registry.stateOf("alpha"), LifecycleState::Registered);

  m_alpha->failInitialize = false;
  EXPECT_TRUE(m_registry.initializeOne("alpha").has_value());
}

TEST_F(PluginRegistryTest, InitializeTwiceIsInvalidState) {
  registerAndInitialize(m_alpha);

  const Result<OperationOutcome> result = m_registry.initializeOne("alpha");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, PlmErrorCode::InvalidState);
  EXPECT_EQ(m_alpha->initializeCalls.load(), 1);
}

TEST_F(PluginRegistryTest, InstallBeforeInitializeIsInvalidState) {
  ASSERT_TRUE(m_registry.registerPlugin("alpha", m_alpha).has_value());

  const Result<OperationOutcome> result = install("alpha", "1.0.0");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, PlmErrorCode::InvalidState);
  EXPECT_EQ(m_alpha->installCalls.load(), 0);
  EXPECT_EQ(m_registry.stateOf("alpha"), LifecycleState::Registered);
}

TEST_F(PluginRegistryTest, InstallRecordsVersionAndDescriptor) {
  registerAndInitialize(m_alpha);

  const Result<OperationOutcome> result = install("alpha", "2.1.0");

  ASSERT_TRUE(result.has_value()) << result.error().message;
  EXPECT_EQ(result->current, LifecycleState::Installed);
  EXPECT_EQ(result->descriptor, "alpha@2.1.0");
  EXPECT_FALSE(result->dryRun);
  EXPECT_EQ(m_alpha->lastInstalledVersion, "2.1.0");

  const Vec<PluginInfo> plugins = m_registry.listPlugins();
  ASSERT_EQ(plugins.size(), 1);
  EXPECT_EQ(plugins.front().installedVersion, "2.1.0");
}

TEST_F(PluginRegistryTest, InvalidVersionIsRejectedBeforeTheHook) {
  registerAndInitialize(m_alpha);

  const Result<OperationOutcome> result = install("alpha", "latest");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, PlmErrorCode::InvalidArgument);
  EXPECT_EQ(m_alpha->installCalls.load(), 0);
}

TEST_F(PluginRegistryTest, DryRunChangesNothing) {
  registerAndInitialize(m_alpha);
  const usize before = transitions().size();

  const Result<OperationOutcome> result = install("alpha", "1.0.0", { .dryRun = true });

  ASSERT_TRUE(result.has_value()) << result.error().message;
  EXPECT_TRUE(result->dryRun);
  EXPECT_FALSE(result->stateChanged());
  EXPECT_EQ(result->descriptor, "dry-run:alpha@1.0.0");
  EXPECT_EQ(m_alpha->installCalls.load(), 0);
  EXPECT_EQ(m_registry.stateOf("alpha"), LifecycleState::Initialized);
  EXPECT_EQ(transitions().size(), before);
}

TEST_F(PluginRegistryTest, DryRunWithInvalidVersionChangesNothing) {
  registerAndInitialize(m_alpha);
  const usize before = transitions().size();

  for (const String& version : { "", "1.0", "latest", "1.0.0-01" }) {
    const Result<OperationOutcome> result = install("alpha", version, { .dryRun = true });

    ASSERT_FALSE(result.has_value()) << version;
    EXPECT_EQ(result.error().code, PlmErrorCode::InvalidArgument) << version;
  }

  EXPECT_EQ(m_alpha->installCalls.load(), 0);
  EXPECT_EQ(m_registry.stateOf("alpha"), LifecycleState::Initialized);
  EXPECT_EQ(transitions().size(), before);
}

TEST_F(PluginRegistryTest, DryRunFromRegisteredIsInvalidState) {
  ASSERT_TRUE(m_registry.registerPlugin("alpha", m_alpha).has_value());
  const usize before = transitions().size();

  const Result<OperationOutcome> installed = install("alpha", "1.0.0", { .dryRun = true });
  ASSERT_FALSE(installed.has_value());
  EXPECT_EQ(installed.error().code, PlmErrorCode::InvalidState);

  const Result<OperationOutcome> uninstalled = uninstall("alpha", "1.0.0", { .force = true, .dryRun = true });
  ASSERT_FALSE(uninstalled.has_value());
  EXPECT_EQ(uninstalled.error().code, PlmErrorCode::InvalidState);

  EXPECT_EQ(m_alpha->installCalls.load(), 0);
  EXPECT_EQ(m_alpha->uninstallCalls.load(), 0);
  EXPECT_EQ(m_registry.stateOf("alpha"), LifecycleState::Registered);
  EXPECT_EQ(transitions().size(), before);
}

TEST_F(PluginRegistryTest, DryRunUninstallChangesNothing) {
  registerAndInitialize(m_alpha);
  ASSERT_TRUE(install("alpha", "1.0.0").has_value());
  const usize before = transitions().size();

  const Result<OperationOutcome> result = uninstall("alpha", "1.0.0", { .dryRun = true });

  ASSERT_TRUE(result.has_value()) << result.error().message;
  EXPECT_TRUE(result->dryRun);
  EXPECT_FALSE(result->stateChanged());
  EXPECT_EQ(result->current, LifecycleState::Installed);

  const Result<OperationOutcome> invalid = uninstall("alpha", "one", { .dryRun = true });
  ASSERT_FALSE(invalid.has_value());
  EXPECT_EQ(invalid.error().code, PlmErrorCode::InvalidArgument);

  EXPECT_EQ(m_alpha->uninstallCalls.load(), 0);
  EXPECT_EQ(m_registry.stateOf("alpha"), LifecycleState::Installed);
  EXPECT_EQ(m_registry.listPlugins().front().installedVersion, "1.0.0");
  EXPECT_EQ(transitions().size(), before);
}

TEST_F(PluginRegistryTest, ReinstallRequiresForce) {
  registerAndInitialize(m_alpha);
  ASSERT_TRUE(install("alpha", "1.0.0").has_value());

  const Result<OperationOutcome> again = install("alpha", "1.0.0");
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().code, PlmErrorCode::InvalidState);

  const Result<OperationOutcome> forced = install("alpha", "1.1.0", { .force = true });
  ASSERT_TRUE(forced.has_value()) << forced.error().message;
  EXPECT_EQ(forced->previous, LifecycleState::Installed);
  EXPECT_EQ(forced->current, LifecycleState::Installed);
  EXPECT_EQ(m_alpha->installCalls.load(), 2);
}

TEST_F(PluginRegistryTest, InstallHookFailureLeavesStateAlone) {
  registerAndInitialize(m_alpha);
  m_alpha->failInstall = true;

  const Result<OperationOutcome> result = install("alpha", "1.0.0");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, PlmErrorCode::InstallFailed);
  EXPECT_NE(result.error().message.find("cannot install 1.0.0"), String::npos);
  EXPECT_EQ(m_registry.stateOf("alpha"), LifecycleState::Initialized);
}

TEST_F(PluginRegistryTest, ThrowingHookBecomesInstallFailed) {
  registerAndInitialize(m_alpha);
  m_alpha->throwOnInstall = true;

  const Result<OperationOutcome> result = install("alpha", "1.0.0");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, PlmErrorCode::InstallFailed);
  EXPECT_NE(result.error().message.find("install exploded"), String::npos);
  EXPECT_EQ(m_registry.stateOf("alpha"), LifecycleState::Initialized);
}

TEST_F(PluginRegistryTest, NonStandardExceptionBecomesInstallFailed) {
  registerAndInitialize(m_alpha);
  m_alpha->throwIntOnInstall = true;

  const Result<OperationOutcome> result = install("alpha", "1.0.0");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, PlmErrorCode::InstallFailed);
  EXPECT_EQ(m_registry.stateOf("alpha"), LifecycleState::Initialized);
}

TEST_F(PluginRegistryTest, HookFailureIsLocatedInTheFailingOperation) {
  registerAndInitialize(m_alpha);
  m_alpha->failInstall = true;

  const Result<OperationOutcome> result = install("alpha", "1.0.0");

  ASSERT_FALSE(result.has_value());
  EXPECT_NE(String(result.error().location.function_name()).find("installLocked"), String::npos)
    << result.error().location.function_name();
}

TEST_F(PluginRegistryTest, UninstallReturnsToInitialized) {
  registerAndInitialize(m_alpha);
  ASSERT_TRUE(install("alpha", "1.0.0").has_value());

  const Result<OperationOutcome> result = uninstall("alpha", "1.0.0");

  ASSERT_TRUE(result.has_value()) << result.error().message;
  EXPECT_EQ(result->previous, LifecycleState::Installed);
  EXPECT_EQ(result->current, LifecycleState::Initialized);
  EXPECT_EQ(m_alpha->uninstallCalls.load(), 1);
  EXPECT_FALSE(m_registry.listPlugins().front().installedVersion.has_value());
}

TEST_F(PluginRegistryTest, UninstallWhenNotInstalledNeedsForce) {
  registerAndInitialize(m_alpha);

  const Result<OperationOutcome> refused = uninstall("alpha", "1.0.0");
  ASSERT_FALSE(refused.has_value());
  EXPECT_EQ(refused.error().code, PlmErrorCode::InvalidState);
  EXPECT_EQ(m_alpha->uninstallCalls.load(), 0);

  const Result<OperationOutcome> forced = uninstall("alpha", "1.0.0", { .force = true });
  ASSERT_TRUE(forced.has_value()) << forced.error().message;
  EXPECT_FALSE(forced->stateChanged());
  EXPECT_EQ(m_alpha->uninstallCalls.load(), 1);
}

TEST_F(PluginRegistryTest, UninstallFailureKeepsInstalled) {
  registerAndInitialize(m_alpha);
  ASSERT_TRUE(install("alpha", "1.0.0").has_value());
  m_alpha->failUninstall = true;

  const Result<OperationOutcome> result = uninstall("alpha", "1.0.0");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, PlmErrorCode::UninstallFailed);
  EXPECT_EQ(m_registry.stateOf("alpha"), LifecycleState::Installed);
}

TEST_F(PluginRegistryTest, ShutdownHookRunsExactlyOnce) {
  registerAndInitialize(m_alpha);

  ASSERT_TRUE(m_registry.shutdownOne("alpha").has_value());

  const Result<OperationOutcome> again = m_registry.shutdownOne("alpha");
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().code, PlmErrorCode::InvalidState);

  EXPECT_TRUE(m_registry.shutdownAll().empty());
  EXPECT_EQ(m_alpha->shutdownCalls.load(), 1);
  EXPECT_EQ(m_registry.stateOf("alpha"), LifecycleState::Shutdown);
}

TEST_F(PluginRegistryTest, FailedShutdownRollsBackAndCanBeRetried) {
  registerAndInitialize(m_alpha);
  ASSERT_TRUE(install("alpha", "1.0.0").has_value());
  m_alpha->failShutdown = true;

  const Result<OperationOutcome> failed = m_registry.shutdownOne("alpha");

  ASSERT_FALSE(failed.has_value());
  EXPECT_EQ(failed.error().code, PlmErrorCode::ShutdownFailed);
  EXPECT_EQ(m_registry.stateOf("alpha"), LifecycleState::Installed);

  m_alpha->failShutdown = false;

  ASSERT_TRUE(m_registry.shutdownOne("alpha").has_value());
  EXPECT_EQ(m_registry.stateOf("alpha"), LifecycleState::Shutdown);
  EXPECT_EQ(m_alpha->shutdownCalls.load(), 2);
}

TEST_F(PluginRegistryTest, ShutdownAllContinuesPastFailures) {
  auto beta  = std::make_shared<MockPlugin>("beta");
  auto gamma = std::make_shared<MockPlugin>("gamma");
  auto delta = std::make_shared<MockPlugin>("delta");

  registerAndInitialize(m_alpha);
  registerAndInitialize(beta);
  registerAndInitialize(gamma);
  ASSERT_TRUE(m_registry.registerPlugin("delta", delta).has_value());

  beta->failShutdown = true;

  const Vec<PluginFailure> failures = m_registry.shutdownAll();

  ASSERT_EQ(failures.size(), 1);
  EXPECT_EQ(failures.front().plugin, "beta");
  EXPECT_EQ(failures.front().error.code, PlmErrorCode::ShutdownFailed);

  EXPECT_EQ(m_registry.stateOf("alpha"), LifecycleState::Shutdown);
  EXPECT_EQ(m_registry.stateOf("beta"), LifecycleState::Initialized);
  EXPECT_EQ(m_registry.stateOf("gamma"), LifecycleState::Shutdown);
  EXPECT_FALSE(m_registry.contains("delta"));
  EXPECT_EQ(delta->shutdownCalls.load(), 0);
}

TEST_F(PluginRegistryTest, ShutdownAllGivesUpOnBusyPluginAfterTimeout) {
  auto beta = std::make_shared<MockPlugin>("beta");

  registerAndInitialize(m_alpha);
  registerAndInitialize(beta);

  Result<OperationGuard> held = m_registry.lockPlugin("alpha");
  ASSERT_TRUE(held.has_value());

  const Vec<PluginFailure> failures = m_registry.shutdownAll(20ms);

  ASSERT_EQ(failures.size(), 1);
  EXPECT_EQ(failures.front().plugin, "alpha");
  EXPECT_EQ(failures.front().error.code, PlmErrorCode::Timeout);
  EXPECT_EQ(m_registry.stateOf("alpha"), LifecycleState::Initialized);
  EXPECT_EQ(m_registry.stateOf("beta"), LifecycleState::Shutdown);
  EXPECT_EQ(m_alpha->shutdownCalls.load(), 0);

  held->release();

  EXPECT_TRUE(m_registry.shutdownAll(20ms).empty());
  EXPECT_EQ(m_registry.stateOf("alpha"), LifecycleState::Shutdown);
}

TEST_F(PluginRegistryTest, ShutdownEntriesStayForAuditUntilReplaced) {
  registerAndInitialize(m_alpha);
  ASSERT_TRUE(m_registry.shutdownOne("alpha").has_value());

  EXPECT_TRUE(m_registry.listPlugins().empty());
  ASSERT_EQ(m_registry.listAll().size(), 1);
  EXPECT_EQ(m_registry.listAll().front().state, LifecycleState::Shutdown);
  EXPECT_FALSE(m_registry.isActive("alpha"));

  auto fresh = std::make_shared<MockPlugin>("alpha", "2.0.0");

  ASSERT_TRUE(m_registry.registerPlugin("alpha", fresh).has_value());
  EXPECT_EQ(m_registry.stateOf("alpha"), LifecycleState::Registered);
  EXPECT_EQ(m_registry.declaredVersion("alpha"), "2.0.0");
  EXPECT_EQ(m_registry.listAll().size(), 1);
}

TEST_F(PluginRegistryTest, UnregisterDropsRegisteredEntryWithoutHooks) {
  ASSERT_TRUE(m_registry.registerPlugin("alpha", m_alpha).has_value());

  const Result<OperationOutcome> result = m_registry.unregisterPlugin("alpha");

  ASSERT_TRUE(result.has_value()) << result.error().message;
  EXPECT_EQ(result->current, LifecycleState::Unregistered);
  EXPECT_FALSE(m_registry.contains("alpha"));
  EXPECT_EQ(m_alpha->shutdownCalls.load(), 0);
}

TEST_F(PluginRegistryTest, UnregisterShutsDownActiveEntry) {
  registerAndInitialize(m_alpha);

  const Result<OperationOutcome> result = m_registry.unregisterPlugin("alpha");

  ASSERT_TRUE(result.has_value()) << result.error().message;
  EXPECT_EQ(result->previous, LifecycleState::Initialized);
  EXPECT_EQ(result->current, LifecycleState::Shutdown);
  EXPECT_EQ(m_alpha->shutdownCalls.load(), 1);
  EXPECT_FALSE(m_registry.contains("alpha"));
}

TEST_F(PluginRegistryTest, UnknownPluginIsNotFound) {
  EXPECT_EQ(m_registry.unregisterPlugin("ghost").error().code, PlmErrorCode::NotFound);
  EXPECT_EQ(m_registry.initializeOne("ghost").error().code, PlmErrorCode::NotFound);
  EXPECT_EQ(m_registry.shutdownOne("ghost").error().code, PlmErrorCode::NotFound);
  EXPECT_EQ(m_registry.declaredVersion("ghost").error().code, PlmErrorCode::NotFound);
  EXPECT_FALSE(m_registry.stateOf("ghost").has_value());
}

TEST_F(PluginRegistryTest, AttachConfigReplacesAndClears) {
  ASSERT_TRUE(m_registry.registerPlugin("alpha", m_alpha).has_value());

  ASSERT_TRUE(m_registry.attachConfig("alpha", PluginConfig::named("alpha", "1.2.0")).has_value());
  EXPECT_EQ(m_registry.getPluginConfig("alpha")->version, "1.2.0");

  ASSERT_TRUE(m_registry.attachConfig("alpha", None).has_value());
  EXPECT_FALSE(m_registry.getPluginConfig("alpha").has_value());

  EXPECT_EQ(m_registry.attachConfig("alpha", PluginConfig::named("beta")).error().code, PlmErrorCode::InvalidArgument);
  EXPECT_EQ(m_registry.attachConfig("ghost", None).error().code, PlmErrorCode::NotFound);
}

TEST_F(PluginRegistryTest, RejectPolicyFailsFastWhenBusy) {
  m_registry.setContentionPolicy(ContentionPolicy::Reject);
  ASSERT_TRUE(m_registry.registerPlugin("alpha", m_alpha).has_value());

  Result<OperationGuard> held = m_registry.lockPlugin("alpha");
  ASSERT_TRUE(held.has_value());
  EXPECT_TRUE(m_registry.listPlugins().front().busy);

  const Result<OperationOutcome> result = m_registry.initializeOne("alpha");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, PlmErrorCode::InvalidState);

  held->release();
  EXPECT_FALSE(m_registry.listPlugins().front().busy);
  EXPECT_TRUE(m_registry.initializeOne("alpha").has_value());
}

TEST_F(PluginRegistryTest, VerboseOperationsReturnATrace) {
  ASSERT_TRUE(m_registry.registerPlugin("alpha", m_alpha).has_value());

  const Result<OperationOutcome> quiet = m_registry.initializeOne("alpha");
  ASSERT_TRUE(quiet.has_value());
  EXPECT_TRUE(quiet->trace.empty());

  const Result<OperationOutcome> verbose = m_registry.shutdownOne("alpha", true);
  ASSERT_TRUE(verbose.has_value());
  EXPECT_FALSE(verbose->trace.empty());
  EXPECT_EQ(verbose->trace.front(), "lock acquired");
}

TEST_F(PluginRegistryTest, ListingIsSortedByName) {
  ASSERT_TRUE(m_registry.registerPlugin("gamma", std::make_shared<MockPlugin>("gamma")).has_value());
  ASSERT_TRUE(m_registry.registerPlugin("alpha", m_alpha).has_value());
  ASSERT_TRUE(m_registry.registerPlugin("beta", std::make_shared<MockPlugin>("beta")).has_value());

  const Vec<PluginInfo> plugins = m_registry.listPlugins();

  ASSERT_EQ(plugins.size(), 3);
  EXPECT_EQ(plugins[0].name, "alpha");
  EXPECT_EQ(plugins[1].name, "beta");
  EXPECT_EQ(plugins[2].name, "gamma");
}

fn main(i32 argc, char** argv) -> i32 {
  InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
