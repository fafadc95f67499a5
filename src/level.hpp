#pragma once
#include "common.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

enum class TileType : uint8_t {
    Wall = 0,
    Floor,
    Corridor,
    DoorOpen,
    DoorClosed,
    DoorLocked,
    // Hidden until discovered; behaves like a wall for movement and sight.
    DoorSecret,
    DoorBroken,
    StairsUp,
    StairsDown,
};

struct Tile {
    TileType type = TileType::Wall;
};

struct Room {
    int id = 0;
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    int x2() const { return x + w; }
    int y2() const { return y + h; }

    bool contains(int px, int py) const {
        return px >= x && px < x2() && py >= y && py < y2();
    }
};

struct GoldPile {
    Vec2i pos{ -1, -1 };
    int amount = 0;
};

// Read-only view of the map the simulation runs on. Level generation lives
// outside this library; levels arrive through parseLevelAscii() or are built
// in code by tests.
class Level {
public:
    int width = 0;
    int height = 0;
    int depth = 1;
    std::vector<Tile> tiles;

    std::vector<Room> rooms;
    std::vector<GoldPile> gold;

    // Wandering-spawn bookkeeping, per level.
    int wanderersSpawned = 0;
    uint32_t lastWanderSpawnTick = 0;

    Level() = default;
    Level(int w, int h);

    bool inBounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < width && y < height;
    }

    Tile& at(int x, int y) { return tiles[static_cast<size_t>(y * width + x)]; }
    const Tile& at(int x, int y) const { return tiles[static_cast<size_t>(y * width + x)]; }

    bool isWalkable(int x, int y) const;
    bool isOpaque(int x, int y) const;
    bool isDoor(int x, int y) const;
    // Closed, locked and secret doors.
    bool isDoorShut(int x, int y) const;
    void openDoor(int x, int y);

    bool hasLineOfSight(int x0, int y0, int x1, int y1) const;

    // Fills outMask (width*height, 1 = visible) with every tile within
    // `radius` (Euclidean) of origin that has line of sight to it.
    void computeVisibleMask(Vec2i origin, int radius, std::vector<uint8_t>& outMask) const;

    // Returns the room whose rectangle contains (x,y), or nullptr for
    // corridors and doorways.
    const Room* roomAt(int x, int y) const;

    int goldIndexAt(int x, int y) const;
    // Removes the pile at (x,y) and returns its amount (0 if none).
    int takeGoldAt(int x, int y);

private:
    bool lineOfSight(int x0, int y0, int x1, int y1) const;
};

// Visibility oracle: fills outMask for observer at origin. The default
// (losVisibility) uses Level::computeVisibleMask; hosts with their own FOV
// can plug theirs in.
using VisibilityFn = std::function<void(const Level& level, Vec2i origin, int radius, std::vector<uint8_t>& outMask)>;

VisibilityFn losVisibility();

// True if the oracle reports `target` visible from `origin` within `radius`.
bool isVisibleFrom(const VisibilityFn& vis, const Level& level, Vec2i origin, Vec2i target, int radius);

// Actor markers found while parsing an ASCII map.
struct LevelMarkers {
    Vec2i playerStart{ -1, -1 };
    struct MonsterMark {
        char letter = '?';
        Vec2i pos{ -1, -1 };
    };
    std::vector<MonsterMark> monsters;
};

// ASCII map format:
//   '#' wall   '.' room floor   ',' corridor   '\'' open door   '+' closed door
//   '=' locked door   '*' secret door   '/' broken door   '<' '>' stairs
//   '$' gold (on room floor)   '@' player start   'A'-'Z' monster (on room floor)
// Lines starting with ';' are comments. "depth = N" sets the level depth.
// Rooms are the bounding boxes of 4-connected room-floor regions.
bool parseLevelAscii(const std::string& text, Level& out, LevelMarkers* markers, std::string* err);
bool loadLevelAscii(const std::string& path, Level& out, LevelMarkers* markers, std::string* err);
