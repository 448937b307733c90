// Window.h

#ifndef WINDOW_H
#define WINDOW_H

#include <SDL2/SDL.h>
#include <string>

class Window {
public:
    Window(const std::string& title, int width, int height, bool fullscreen = false);
    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    SDL_Window* getSDLWindow() const { return window; }
    SDL_GLContext getContext() const { return context; }

    // Drawable size; differs from the requested size in fullscreen.
    void getDrawableSize(int& w, int& h) const;
    void swap() const;

private:
    SDL_Window* window;
    SDL_GLContext context;
};

#endif // WINDOW_H
