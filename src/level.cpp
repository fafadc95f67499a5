#include "level.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <fstream>
#include <sstream>

Level::Level(int w, int h) : width(w), height(h), tiles(static_cast<size_t>(w * h)) {}

bool Level::isWalkable(int x, int y) const {
    if (!inBounds(x, y)) return false;
    switch (at(x, y).type) {
        case TileType::Floor:
        case TileType::Corridor:
        case TileType::DoorOpen:
        case TileType::DoorBroken:
        case TileType::StairsUp:
        case TileType::StairsDown:
            return true;
        case TileType::Wall:
        case TileType::DoorClosed:
        case TileType::DoorLocked:
        case TileType::DoorSecret:
            return false;
    }
    return false;
}

bool Level::isOpaque(int x, int y) const {
    if (!inBounds(x, y)) return true;
    TileType t = at(x, y).type;
    return (t == TileType::Wall || t == TileType::DoorClosed || t == TileType::DoorLocked || t == TileType::DoorSecret);
}

bool Level::isDoor(int x, int y) const {
    if (!inBounds(x, y)) return false;
    TileType t = at(x, y).type;
    return (t == TileType::DoorOpen || t == TileType::DoorClosed || t == TileType::DoorLocked ||
            t == TileType::DoorSecret || t == TileType::DoorBroken);
}

bool Level::isDoorShut(int x, int y) const {
    if (!inBounds(x, y)) return false;
    TileType t = at(x, y).type;
    return (t == TileType::DoorClosed || t == TileType::DoorLocked || t == TileType::DoorSecret);
}

void Level::openDoor(int x, int y) {
    if (!inBounds(x, y)) return;
    if (at(x, y).type == TileType::DoorClosed) at(x, y).type = TileType::DoorOpen;
}

bool Level::lineOfSight(int x0, int y0, int x1, int y1) const {
    // Bresenham line; stop if opaque tile blocks.
    // A diagonal step between two opaque tiles also blocks, which keeps sight
    // consistent with the no-corner-cutting movement rule.
    int dx = std::abs(x1 - x0);
    int dy = std::abs(y1 - y0);
    int sx = (x0 < x1) ? 1 : -1;
    int sy = (y0 < y1) ? 1 : -1;
    int err = dx - dy;

    int x = x0;
    int y = y0;

    while (true) {
        if (x == x1 && y == y1) break;
        if (!(x == x0 && y == y0)) {
            if (isOpaque(x, y)) return false;
        }

        const int prevX = x;
        const int prevY = y;

        int e2 = err * 2;
        if (e2 > -dy) { err -= dy; x += sx; }
        if (e2 <  dx) { err += dx; y += sy; }

        if (!inBounds(x, y)) return false;

        const int stepX = x - prevX;
        const int stepY = y - prevY;
        if (stepX != 0 && stepY != 0) {
            if (isOpaque(prevX + stepX, prevY) && isOpaque(prevX, prevY + stepY)) return false;
        }
    }

    return true;
}

bool Level::hasLineOfSight(int x0, int y0, int x1, int y1) const {
    if (!inBounds(x0, y0) || !inBounds(x1, y1)) return false;
    return lineOfSight(x0, y0, x1, y1);
}

void Level::computeVisibleMask(Vec2i origin, int radius, std::vector<uint8_t>& outMask) const {
    outMask.assign(static_cast<size_t>(width * height), uint8_t{0});
    if (!inBounds(origin.x, origin.y) || radius < 0) return;

    const int r2 = radius * radius;
    const int x0 = std::max(0, origin.x - radius);
    const int x1 = std::min(width - 1, origin.x + radius);
    const int y0 = std::max(0, origin.y - radius);
    const int y1 = std::min(height - 1, origin.y + radius);

    for (int y = y0; y <= y1; ++y) {
        for (int x = x0; x <= x1; ++x) {
            const int ddx = x - origin.x;
            const int ddy = y - origin.y;
            if (ddx * ddx + ddy * ddy > r2) continue;
            if (lineOfSight(origin.x, origin.y, x, y)) {
                outMask[static_cast<size_t>(y * width + x)] = 1;
            }
        }
    }
}

const Room* Level::roomAt(int x, int y) const {
    for (const Room& r : rooms) {
        if (r.contains(x, y)) return &r;
    }
    return nullptr;
}

int Level::goldIndexAt(int x, int y) const {
    for (size_t i = 0; i < gold.size(); ++i) {
        if (gold[i].pos.x == x && gold[i].pos.y == y) return static_cast<int>(i);
    }
    return -1;
}

int Level::takeGoldAt(int x, int y) {
    const int i = goldIndexAt(x, y);
    if (i < 0) return 0;
    const int amount = gold[static_cast<size_t>(i)].amount;
    gold.erase(gold.begin() + i);
    return amount;
}

VisibilityFn losVisibility() {
    return [](const Level& level, Vec2i origin, int radius, std::vector<uint8_t>& outMask) {
        level.computeVisibleMask(origin, radius, outMask);
    };
}

bool isVisibleFrom(const VisibilityFn& vis, const Level& level, Vec2i origin, Vec2i target, int radius) {
    if (!level.inBounds(target.x, target.y)) return false;
    std::vector<uint8_t> mask;
    if (vis) vis(level, origin, radius, mask);
    else level.computeVisibleMask(origin, radius, mask);
    const size_t i = static_cast<size_t>(target.y * level.width + target.x);
    return i < mask.size() && mask[i] != 0;
}

namespace {

std::string trim(std::string s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(), s.end());
    return s;
}

// Labels 4-connected room-floor regions and records their bounding boxes.
void detectRooms(Level& lvl, const std::vector<uint8_t>& roomFloor) {
    const int W = lvl.width;
    const int H = lvl.height;
    std::vector<uint8_t> seen(static_cast<size_t>(W * H), uint8_t{0});
    std::vector<Vec2i> stack;

    for (int y = 0; y < H; ++y) {
        for (int x = 0; x < W; ++x) {
            const size_t i = static_cast<size_t>(y * W + x);
            if (!roomFloor[i] || seen[i]) continue;

            int minX = x, maxX = x, minY = y, maxY = y;
            seen[i] = 1;
            stack.clear();
            stack.push_back({x, y});
            while (!stack.empty()) {
                const Vec2i p = stack.back();
                stack.pop_back();
                minX = std::min(minX, p.x);
                maxX = std::max(maxX, p.x);
                minY = std::min(minY, p.y);
                maxY = std::max(maxY, p.y);

                for (int d = 0; d < 4; ++d) {
                    const int nx = p.x + DIRS8[d][0];
                    const int ny = p.y + DIRS8[d][1];
                    if (!lvl.inBounds(nx, ny)) continue;
                    const size_t ni = static_cast<size_t>(ny * W + nx);
                    if (!roomFloor[ni] || seen[ni]) continue;
                    seen[ni] = 1;
                    stack.push_back({nx, ny});
                }
            }

            Room r;
            r.id = static_cast<int>(lvl.rooms.size());
            r.x = minX;
            r.y = minY;
            r.w = maxX - minX + 1;
            r.h = maxY - minY + 1;
            lvl.rooms.push_back(r);
        }
    }
}

} // namespace

bool parseLevelAscii(const std::string& text, Level& out, LevelMarkers* markers, std::string* err) {
    std::vector<std::string> rows;
    int depth = 1;

    std::istringstream in(text);
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty() && line[0] == ';') continue;

        const std::string t = trim(line);
        if (t.empty()) continue;

        if (t.rfind("depth", 0) == 0) {
            const auto eq = t.find('=');
            if (eq == std::string::npos) {
                if (err) *err = "Line " + std::to_string(lineNo) + ": expected 'depth = N'";
                return false;
            }
            try {
                depth = std::stoi(trim(t.substr(eq + 1)));
            } catch (const std::exception&) {
                if (err) *err = "Line " + std::to_string(lineNo) + ": invalid depth";
                return false;
            }
            if (depth < 1) {
                if (err) *err = "Line " + std::to_string(lineNo) + ": depth must be >= 1";
                return false;
            }
            continue;
        }

        rows.push_back(line);
    }

    if (rows.empty()) {
        if (err) *err = "map has no rows";
        return false;
    }

    size_t maxW = 0;
    for (const auto& r : rows) maxW = std::max(maxW, r.size());

    Level lvl(static_cast<int>(maxW), static_cast<int>(rows.size()));
    lvl.depth = depth;
    std::vector<uint8_t> roomFloor(lvl.tiles.size(), uint8_t{0});

    LevelMarkers found;

    for (int y = 0; y < lvl.height; ++y) {
        const std::string& r = rows[static_cast<size_t>(y)];
        for (int x = 0; x < lvl.width; ++x) {
            const char c = (static_cast<size_t>(x) < r.size()) ? r[static_cast<size_t>(x)] : ' ';
            TileType t = TileType::Wall;
            bool floor = false;

            switch (c) {
                case '#': case ' ': t = TileType::Wall; break;
                case '.': t = TileType::Floor; floor = true; break;
                case ',': t = TileType::Corridor; break;
                case '\'': t = TileType::DoorOpen; break;
                case '+': t = TileType::DoorClosed; break;
                case '=': t = TileType::DoorLocked; break;
                case '*': t = TileType::DoorSecret; break;
                case '/': t = TileType::DoorBroken; break;
                case '<': t = TileType::StairsUp; break;
                case '>': t = TileType::StairsDown; break;
                case '$':
                    t = TileType::Floor;
                    floor = true;
                    lvl.gold.push_back({{x, y}, 2 + depth * 8});
                    break;
                case '@':
                    if (found.playerStart.x >= 0) {
                        if (err) *err = "map has more than one '@'";
                        return false;
                    }
                    t = TileType::Floor;
                    floor = true;
                    found.playerStart = {x, y};
                    break;
                default:
                    if (c >= 'A' && c <= 'Z') {
                        t = TileType::Floor;
                        floor = true;
                        found.monsters.push_back({c, {x, y}});
                        break;
                    }
                    if (err) *err = "unknown map character '" + std::string(1, c) + "' at " +
                                    std::to_string(x) + "," + std::to_string(y);
                    return false;
            }

            lvl.at(x, y).type = t;
            if (floor) roomFloor[static_cast<size_t>(y * lvl.width + x)] = 1;
        }
    }

    detectRooms(lvl, roomFloor);

    out = std::move(lvl);
    if (markers) *markers = std::move(found);
    return true;
}

bool loadLevelAscii(const std::string& path, Level& out, LevelMarkers* markers, std::string* err) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        if (err) *err = "cannot open map file: " + path;
        return false;
    }
    std::stringstream ss;
    ss << f.rdbuf();
    return parseLevelAscii(ss.str(), out, markers, err);
}
