#include "sandbox/archive.hpp"
#include <set>
#include "common/tar.hpp"

namespace sandbox {
using namespace std;

const char *ENTRY_PROGRAM_NAME = "main.py";

const char *TURTLE_MODULE_NAME = "turtle.py";

const char *TURTLE_MODULE_SOURCE = R"PY(# Minimal turtle-like module that writes turtle.svg on exit.
import atexit
import math

WIDTH = 500
HEIGHT = 500

_state = {
    "x": 0.0,
    "y": 0.0,
    "heading": 0.0,
    "pen": True,
    "color": "#6aa6ff",
    "width": 2,
}
_paths = []


def _to_svg(x, y):
    return x + WIDTH / 2, HEIGHT / 2 - y


def _line_to(x, y):
    if _state["pen"]:
        _paths.append((_state["x"], _state["y"], x, y, _state["color"], _state["width"]))
    _state["x"], _state["y"] = x, y


def forward(dist):
    radians = math.radians(_state["heading"])
    x = _state["x"] + math.cos(radians) * dist
    y = _state["y"] + math.sin(radians) * dist
    _line_to(x, y)


def backward(dist):
    forward(-dist)


def left(angle):
    _state["heading"] = (_state["heading"] + angle) % 360


def right(angle):
    _state["heading"] = (_state["heading"] - angle) % 360


def penup():
    _state["pen"] = False


def pendown():
    _state["pen"] = True


def goto(x, y):
    _line_to(float(x), float(y))


def setheading(angle):
    _state["heading"] = float(angle) % 360


def color(value):
    _state["color"] = str(value)


def pensize(value):
    _state["width"] = max(1, int(value))


def circle(radius, steps=36):
    step = 360 / steps
    step_len = (2 * math.pi * radius) / steps
    for _ in range(steps):
        forward(step_len)
        left(step)


def write_svg(path="turtle.svg"):
    parts = [
        f'<svg xmlns="http://www.w3.org/2000/svg" width="{WIDTH}" height="{HEIGHT}" ',
        f'viewBox="0 0 {WIDTH} {HEIGHT}">',
        '<rect width="100%" height="100%" fill="#0b0f14"/>',
    ]
    for x1, y1, x2, y2, color, width in _paths:
        sx1, sy1 = _to_svg(x1, y1)
        sx2, sy2 = _to_svg(x2, y2)
        parts.append(
            f'<line x1="{sx1}" y1="{sy1}" x2="{sx2}" y2="{sy2}" '
            f'stroke="{color}" stroke-width="{width}" stroke-linecap="round" />'
        )
    parts.append("</svg>")
    with open(path, "w", encoding="utf-8") as handle:
        handle.write("\n".join(parts))


def done():
    write_svg()


class Turtle:
    def forward(self, dist): forward(dist)
    def backward(self, dist): backward(dist)
    def left(self, angle): left(angle)
    def right(self, angle): right(angle)
    def penup(self): penup()
    def pendown(self): pendown()
    def goto(self, x, y): goto(x, y)
    def setheading(self, angle): setheading(angle)
    def color(self, value): color(value)
    def pensize(self, value): pensize(value)
    def circle(self, radius, steps=36): circle(radius, steps)


class _Screen:
    def bye(self):
        pass


def Screen():
    return _Screen()


atexit.register(done)
)PY";

/**
 * @brief 计算 path 的所有上级目录，比如 a/b/c.txt 得到 a、a/b
 */
static vector<string> parent_directories(const string &path) {
    vector<string> result;
    for (size_t pos = path.find('/'); pos != string::npos; pos = path.find('/', pos + 1))
        if (pos > 0 && path[pos - 1] != '/') result.push_back(path.substr(0, pos));
    return result;
}

string build_archive(const string &code, const vector<sanitized_file> &files, const runner_config &config) {
    tar_writer writer(config.run_uid(), config.run_gid());
    writer.add_file(ENTRY_PROGRAM_NAME, code);
    writer.add_file(TURTLE_MODULE_NAME, TURTLE_MODULE_SOURCE);

    set<string> directories;
    for (auto &file : files) {
        for (auto &dir : parent_directories(file.path()))
            if (directories.insert(dir).second)
                writer.add_directory(dir);
        writer.add_file(file.path(), file.content());
    }
    return writer.finish();
}

}  // namespace sandbox
