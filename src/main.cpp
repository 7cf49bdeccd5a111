#include <signal.h>
#include <stdlib.h>
#include <time.h>

#include <atomic>
#include <memory>

#include "app_config.h"
#include "button_source.h"
#include "display_service.h"
#include "epd_panel.h"
#include "logger.h"
#include "mock_panel.h"
#include "platform.h"
DEFINE_MODULE_LOGGER(MainLog)

namespace {

std::atomic<bool> stopRequested{false};

void onSignal(int sig) {
  (void)sig;
  stopRequested = true;
}

bool installSignalHandlers() {
  struct sigaction sa;
  sa.sa_handler = onSignal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  return sigaction(SIGINT, &sa, nullptr) == 0 && sigaction(SIGTERM, &sa, nullptr) == 0;
}

}  // namespace

int main(int argc, char** argv) {
  const char* envPath = argc > 1 ? argv[1] : ".env";

  InkPet::AppConfig cfg;
  if (!InkPet::AppConfigLoader::load(cfg, envPath)) return 2;
  InkPet::AppConfigLoader::applyEnvironment(cfg);

  Logger::begin(cfg.debugMode);
  MainLog::println("[BOOT] inkpet starting");
  InkPet::AppConfigLoader::dump(cfg);

  if (!cfg.deviceTimezone.empty()) {
    setenv("TZ", cfg.deviceTimezone.c_str(), 1);
    tzset();
  }

  std::unique_ptr<InkPet::Panel> panel;
  if (cfg.mockHardware) {
    panel = std::make_unique<InkPet::MockPanel>(cfg.mockDumpPath);
  } else {
    panel = std::make_unique<InkPet::EpdPanel>();
  }

  InkPet::DisplayService service(cfg, *panel);

  std::unique_ptr<InkPet::ButtonSource> buttons;
  if (cfg.mockHardware) {
    buttons = std::make_unique<InkPet::ConsoleButtons>(service.buttonQueue());
  } else {
    InkPet::GpioButtons::Config btnCfg;
    buttons = std::make_unique<InkPet::GpioButtons>(service.buttonQueue(), btnCfg);
  }

  if (!installSignalHandlers()) {
    MainLog::println("[BOOT] signal handlers not installed, stop with SIGKILL only");
  }

  if (!service.setup(Platform::millis(), buttons.get())) {
    MainLog::println("[BOOT] setup failed");
    buttons->stop();
    service.shutdown(Platform::millis());
    return 1;
  }

  int rc = service.run(stopRequested);
  buttons->stop();
  service.shutdown(Platform::millis());
  MainLog::printf("[BOOT] exit %d\n", rc);
  return rc;
}
