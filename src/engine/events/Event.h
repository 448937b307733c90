// Event.h

#pragma once
#include <string>

enum class EventType {
    Quit,
    KeyDown,
    MouseButtonDown,
    MouseButtonUp,
    MouseWheel,
    CardDrawn,
    DeckExhausted,
    CardReturnedToDeck
};

// Engine-side key codes; the window layer translates from SDL.
enum class Key {
    Escape,
    Other
};

enum class MouseButton {
    Left,
    Middle,
    Right,
    Other
};

// Base event class.
class Event {
public:
    explicit Event(EventType type) : type(type) {}
    virtual ~Event() = default;
    EventType getType() const { return type; }
    virtual std::string toString() const { return "Generic Event"; }
private:
    EventType type;
};

class QuitEvent : public Event {
public:
    QuitEvent() : Event(EventType::Quit) {}
    std::string toString() const override { return "QuitEvent"; }
};

class KeyDownEvent : public Event {
public:
    explicit KeyDownEvent(Key key)
        : Event(EventType::KeyDown), key(key) {}
    Key getKey() const { return key; }
    std::string toString() const override {
        return std::string("KeyDownEvent ") + (key == Key::Escape ? "Escape" : "Other");
    }
private:
    Key key;
};

class MouseButtonDownEvent : public Event {
public:
    MouseButtonDownEvent(MouseButton button, int x, int y)
        : Event(EventType::MouseButtonDown), button(button), x(x), y(y) {}
    MouseButton getButton() const { return button; }
    int getX() const { return x; }
    int getY() const { return y; }
    std::string toString() const override {
        return "MouseButtonDownEvent at (" + std::to_string(x) + ", " + std::to_string(y) + ")";
    }
private:
    MouseButton button;
    int x, y;
};

class MouseButtonUpEvent : public Event {
public:
    MouseButtonUpEvent(MouseButton button, int x, int y)
        : Event(EventType::MouseButtonUp), button(button), x(x), y(y) {}
    MouseButton getButton() const { return button; }
    int getX() const { return x; }
    int getY() const { return y; }
    std::string toString() const override {
        return "MouseButtonUpEvent at (" + std::to_string(x) + ", " + std::to_string(y) + ")";
    }
private:
    MouseButton button;
    int x, y;
};

// Vertical wheel steps; positive scrolls away from the user.
class MouseWheelEvent : public Event {
public:
    explicit MouseWheelEvent(int steps)
        : Event(EventType::MouseWheel), steps(steps) {}
    int getSteps() const { return steps; }
    std::string toString() const override {
        return "MouseWheelEvent steps=" + std::to_string(steps);
    }
private:
    int steps;
};
