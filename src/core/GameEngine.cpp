/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/GameEngine.hpp"
#include "core/GameLoop.hpp"
#include "core/Logger.hpp"
#include "managers/FontManager.hpp"
#include "managers/InputManager.hpp"
#include <format>
#include <string>

namespace {
constexpr int DEFAULT_WINDOW_WIDTH{1280};
constexpr int DEFAULT_WINDOW_HEIGHT{720};
constexpr SDL_Color BACKDROP{24, 26, 28, 255};
}

bool GameEngine::init(std::string_view title, int width, int height, bool fullscreen,
                      bool vsync) {
  if (!SDL_Init(SDL_INIT_VIDEO)) {
    GAMEENGINE_CRITICAL(std::format("SDL_Init(VIDEO) failed: {}", SDL_GetError()));
    return false;
  }
  m_sdlInitialized = true;

  if (width <= 0 || height <= 0) {
    GAMEENGINE_WARN(std::format("Window size {}x{} ignored, using {}x{}", width, height,
                                DEFAULT_WINDOW_WIDTH, DEFAULT_WINDOW_HEIGHT));
    width = DEFAULT_WINDOW_WIDTH;
    height = DEFAULT_WINDOW_HEIGHT;
  }

  SDL_WindowFlags flags = SDL_WINDOW_RESIZABLE;
  if (fullscreen) {
    flags |= SDL_WINDOW_FULLSCREEN;
  }
  const std::string titleText(title);
  mp_window.reset(SDL_CreateWindow(titleText.c_str(), width, height, flags));
  if (!mp_window) {
    GAMEENGINE_CRITICAL(std::format("SDL_CreateWindow failed: {}", SDL_GetError()));
    return false;
  }
  m_isFullscreen = fullscreen;

  mp_renderer.reset(SDL_CreateRenderer(mp_window.get(), nullptr));
  if (!mp_renderer) {
    GAMEENGINE_CRITICAL(std::format("SDL_CreateRenderer failed: {}", SDL_GetError()));
    return false;
  }
  GAMEENGINE_DEBUG(std::format("Renderer backend: {}",
                               SDL_GetRendererName(mp_renderer.get()) ? SDL_GetRendererName(mp_renderer.get())
                                                                      : "unknown"));

  if (!FontManager::Instance().init()) {
    return false;
  }

  configurePacing(vsync);
  if (!SDL_SetRenderDrawBlendMode(mp_renderer.get(), SDL_BLENDMODE_BLEND)) {
    GAMEENGINE_ERROR(std::format("Alpha blending unavailable: {}", SDL_GetError()));
  }
  onWindowResize();

  GAMEENGINE_INFO(std::format("Window {}x{}{}", m_logicalWidth, m_logicalHeight,
                              m_isFullscreen ? " (fullscreen)" : ""));
  return true;
}

bool GameEngine::setState(std::unique_ptr<GameState> state) {
  if (mp_currentState) {
    GAMEENGINE_DEBUG(std::format("Leaving {}", mp_currentState->getName()));
    mp_currentState->exit();
    mp_currentState.reset();
  }
  if (!state) {
    return true;
  }

  if (!state->enter()) {
    GAMEENGINE_ERROR(std::format("{} refused to start", state->getName()));
    return false;
  }
  GAMEENGINE_DEBUG(std::format("Entered {}", state->getName()));
  mp_currentState = std::move(state);
  return true;
}

void GameEngine::handleEvents() {
  InputManager& input = InputManager::Instance();
  input.update();

  SDL_Event event;
  while (SDL_PollEvent(&event)) {
    switch (event.type) {
      case SDL_EVENT_QUIT:
        GAMEENGINE_INFO("Window closed");
        requestQuit();
        break;
      case SDL_EVENT_KEY_DOWN:
        if (event.key.scancode == SDL_SCANCODE_F11 && !event.key.repeat) {
          toggleFullscreen();
        } else {
          input.onKeyDown(event);
        }
        break;
      case SDL_EVENT_KEY_UP:
        input.onKeyUp(event);
        break;
      case SDL_EVENT_MOUSE_MOTION:
        if (!SDL_ConvertEventToRenderCoordinates(mp_renderer.get(), &event)) {
          GAMEENGINE_WARN(std::format("Mouse position not mapped: {}", SDL_GetError()));
          break;
        }
        input.onMouseMove(event, static_cast<float>(m_logicalWidth),
                            static_cast<float>(m_logicalHeight));
        break;
      case SDL_EVENT_WINDOW_FOCUS_LOST:
        onFocusChanged(false);
        break;
      case SDL_EVENT_WINDOW_FOCUS_GAINED:
        onFocusChanged(true);
        break;
      case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED:
        onWindowResize();
        break;
      default:
        break;
    }
  }

  input.updateEdges();
  if (mp_currentState) {
    mp_currentState->handleInput();
  }
}

void GameEngine::update(float stepSeconds) {
  if (mp_currentState) {
    mp_currentState->update(stepSeconds);
  }
}

void GameEngine::render() {
  SDL_Renderer* renderer = mp_renderer.get();
  SDL_SetRenderDrawColor(renderer, BACKDROP.r, BACKDROP.g, BACKDROP.b, BACKDROP.a);
  SDL_RenderClear(renderer);
  if (mp_currentState) {
    mp_currentState->render(renderer);
  }
  SDL_RenderPresent(renderer);
}

void GameEngine::requestQuit() {
  if (auto gameLoop = m_gameLoop.lock()) {
    gameLoop->stop();
  }
}

void GameEngine::toggleFullscreen() {
  if (!mp_window) {
    return;
  }
  const bool wanted = !m_isFullscreen;
  if (!SDL_SetWindowFullscreen(mp_window.get(), wanted)) {
    GAMEENGINE_ERROR(std::format("SDL_SetWindowFullscreen({}) failed: {}", wanted, SDL_GetError()));
    return;
  }
  m_isFullscreen = wanted;
}

void GameEngine::clean() {
  setState(nullptr);
  InputManager::Instance().clean();

  // Cached HUD text textures belong to the renderer
  FontManager::Instance().clean();
  mp_renderer.reset();
  mp_window.reset();

  if (m_sdlInitialized) {
    SDL_Quit();
    m_sdlInitialized = false;
  }
  GAMEENGINE_INFO("SDL released");
}

void GameEngine::configurePacing(bool vsyncRequested) {
  auto gameLoop = m_gameLoop.lock();

  bool hardware = false;
  if (vsyncRequested) {
    int mode = 0;
    if (!SDL_SetRenderVSync(mp_renderer.get(), 1)) {
      GAMEENGINE_WARN(std::format("VSync refused: {}", SDL_GetError()));
    } else if (!SDL_GetRenderVSync(mp_renderer.get(), &mode) || mode <= 0) {
      GAMEENGINE_WARN(std::format("VSync requested but the renderer reports mode {}", mode));
    } else {
      hardware = true;
    }
  } else if (!SDL_SetRenderVSync(mp_renderer.get(), SDL_RENDERER_VSYNC_DISABLED)) {
    GAMEENGINE_WARN(std::format("Could not turn VSync off: {}", SDL_GetError()));
  }

  if (gameLoop) {
    gameLoop->setPacing(hardware ? FramePacing::Hardware : FramePacing::Software);
    GAMEENGINE_INFO(hardware ? std::string("Frames paced by VSync")
                             : std::format("Frames paced in software at {} FPS",
                                           gameLoop->getTargetFPS()));
  }
}

void GameEngine::onFocusChanged(bool focused) {
  // Keys released while unfocused never arrive
  InputManager::Instance().reset();

  if (auto gameLoop = m_gameLoop.lock()) {
    gameLoop->setPaused(!focused);
  }
  if (mp_currentState) {
    mp_currentState->onFocusChanged(focused);
  }
}

void GameEngine::onWindowResize() {
  int pixelWidth = 0;
  int pixelHeight = 0;
  if (!SDL_GetRenderOutputSize(mp_renderer.get(), &pixelWidth, &pixelHeight)) {
    GAMEENGINE_ERROR(std::format("SDL_GetRenderOutputSize failed: {}", SDL_GetError()));
    return;
  }

  // The panorama is laid out in output pixels, no logical scaling
  m_logicalWidth = pixelWidth;
  m_logicalHeight = pixelHeight;
  if (!SDL_SetRenderLogicalPresentation(mp_renderer.get(), pixelWidth, pixelHeight,
                                        SDL_LOGICAL_PRESENTATION_DISABLED)) {
    GAMEENGINE_ERROR(std::format("SDL_SetRenderLogicalPresentation failed: {}", SDL_GetError()));
  }
  GAMEENGINE_DEBUG(std::format("Output {}x{}", pixelWidth, pixelHeight));
}
