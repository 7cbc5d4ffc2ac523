/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/GameEngine.hpp"
#include "core/GameLoop.hpp"
#include "core/Logger.hpp"
#include "core/LookoutConfig.hpp"
#include "gameStates/LookoutState.hpp"
#include <charconv>
#include <cstdint>
#include <exception>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>

const std::string GAME_NAME{"Fire Lookout"};
const std::string DEFAULT_CONFIG_PATH{"res/lookout.json"};

namespace {

struct LaunchOptions {
  std::string configPath{DEFAULT_CONFIG_PATH};
  std::optional<uint32_t> seed{};
  bool showHelp{false};
};

void printUsage(std::string_view program) {
  std::cout << std::format(
      "Usage: {} [--config <path>] [--seed <n>] [--help]\n"
      "  --config <path>  Session tuning file (default {})\n"
      "  --seed <n>       Seed for weather and fire placement (default: random)\n"
      "  --help           Show this message\n\n"
      "Controls: Left/Right or A/D pan, O or Tab raise the fire-finder,\n"
      "          I/J/K/L or the mouse aim, Space report, F1 cycle weather,\n"
      "          F11 fullscreen, Esc quit\n",
      program, DEFAULT_CONFIG_PATH);
}

// Returns std::nullopt and logs on malformed arguments
std::optional<LaunchOptions> parseArguments(int argc, char* argv[]) {
  LaunchOptions options;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg{argv[i]};

    if (arg == "--help" || arg == "-h") {
      options.showHelp = true;
    } else if (arg == "--config") {
      if (i + 1 >= argc) {
        CONFIG_CRITICAL("--config needs a file path");
        return std::nullopt;
      }
      options.configPath = argv[++i];
    } else if (arg == "--seed") {
      if (i + 1 >= argc) {
        CONFIG_CRITICAL("--seed needs a number");
        return std::nullopt;
      }
      const std::string_view value{argv[++i]};
      uint32_t seed = 0;
      const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), seed);
      if (ec != std::errc() || ptr != value.data() + value.size()) {
        CONFIG_CRITICAL(std::format("Invalid seed '{}'", value));
        return std::nullopt;
      }
      options.seed = seed;
    } else {
      CONFIG_CRITICAL(std::format("Unknown argument '{}'", arg));
      return std::nullopt;
    }
  }
  return options;
}

} // namespace

int main(int argc, char* argv[]) {
  const auto options = parseArguments(argc, argv);
  if (!options) {
    printUsage(argv[0]);
    return 2;
  }
  if (options->showHelp) {
    printUsage(argv[0]);
    return 0;
  }

  GAMEENGINE_INFO(std::format("Initializing {}", GAME_NAME));

  // Fail fast on a broken config instead of running with half the tuning
  Lookout::LookoutConfig config;
  try {
    config = Lookout::LookoutConfig::loadFromFile(options->configPath);
    CONFIG_INFO(std::format("Config loaded from {}", options->configPath));
  } catch (const std::exception& e) {
    CONFIG_CRITICAL(e.what());
    return 1;
  }

  const uint32_t seed = options->seed ? *options->seed : std::random_device{}();
  GAMEENGINE_INFO(std::format("Session seed: {}", seed));

  auto gameLoop = std::make_shared<GameLoop>(config.graphics.targetFPS);
  GameEngine& gameEngine = GameEngine::Instance();
  gameEngine.setGameLoop(gameLoop);

  if (!gameEngine.init(GAME_NAME, config.graphics.windowWidth, config.graphics.windowHeight,
                       config.graphics.fullscreen, config.graphics.vsync)) {
    GAMEENGINE_CRITICAL(std::format("{} could not open its window", GAME_NAME));
    gameEngine.clean();
    return 1;
  }

  if (!gameEngine.setState(std::make_unique<LookoutState>(config, seed))) {
    GAMEENGINE_CRITICAL("Failed to enter the lookout");
    gameEngine.clean();
    return 1;
  }

  gameLoop->setEventHandler([&gameEngine]() { gameEngine.handleEvents(); });
  gameLoop->setStepHandler([&gameEngine](float stepSeconds) { gameEngine.update(stepSeconds); });
  gameLoop->setRenderHandler([&gameEngine]() { gameEngine.render(); });

  GAMEENGINE_INFO("Starting Main Loop");
  const bool loopOk = gameLoop->run();

  GAMEENGINE_INFO(std::format("Game {} shutting down", GAME_NAME));
  gameEngine.clean();

  return loopOk ? 0 : 1;
}
