#include <examples/todo_app.hpp>
#include <ripple/ui/memory_backend.hpp>
#include <ripple/ui/runtime.hpp>

#if !defined(_WIN32) && !defined(__linux__)
int main() { return 0; }
#else

#include <GLFW/glfw3.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#if defined(RIPPLE_HAS_FREETYPE) && RIPPLE_HAS_FREETYPE
#include <ft2build.h>
#include FT_FREETYPE_H
#endif

using namespace ripple::ui;
using namespace ripple::ui::examples;

static void gl_set_ortho(int w, int h) {
  glViewport(0, 0, w, h);
  glMatrixMode(GL_PROJECTION);
  glLoadIdentity();
  glOrtho(0.0, static_cast<double>(w), static_cast<double>(h), 0.0, -1.0, 1.0);
  glMatrixMode(GL_MODELVIEW);
  glLoadIdentity();
}

struct Rgba {
  std::uint8_t r{};
  std::uint8_t g{};
  std::uint8_t b{};
  std::uint8_t a{255};
};

struct GLTextEntry {
  GLuint texture{};
  int w{};
  int h{};
};

static std::string readable_font_path() {
  const char *candidates[] = {
      "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
      "/usr/share/fonts/truetype/freefont/FreeSans.ttf",
      "/usr/share/fonts/truetype/noto/NotoSans-Regular.ttf",
      "/usr/share/fonts/TTF/DejaVuSans.ttf",
  };
  for (const char *p : candidates) {
    if (FILE *f = std::fopen(p, "rb")) {
      std::fclose(f);
      return std::string{p};
    }
  }
  return {};
}

// Rasterizes whole strings into alpha textures, keyed by size and content.
// Without FreeType no text is drawn; boxes still are.
class GLTextCache {
public:
  GLTextCache() = default;
  GLTextCache(const GLTextCache &) = delete;
  GLTextCache &operator=(const GLTextCache &) = delete;

  ~GLTextCache() {
    for (auto &kv : cache_) {
      if (kv.second.texture != 0) {
        glDeleteTextures(1, &kv.second.texture);
      }
    }
#if defined(RIPPLE_HAS_FREETYPE) && RIPPLE_HAS_FREETYPE
    if (face_) {
      FT_Done_Face(face_);
    }
    if (ft_) {
      FT_Done_FreeType(ft_);
    }
#endif
  }

  const GLTextEntry *get(std::string_view text, int font_px) {
    if (text.empty()) {
      return nullptr;
    }
    std::string key = std::to_string(font_px);
    key.push_back(':');
    key.append(text);
    if (const auto it = cache_.find(key); it != cache_.end()) {
      return &it->second;
    }
    GLTextEntry e{};
    if (!rasterize(text, font_px, e)) {
      return nullptr;
    }
    return &cache_.emplace(std::move(key), e).first->second;
  }

private:
  bool rasterize(std::string_view text, int font_px, GLTextEntry &out) {
#if !(defined(RIPPLE_HAS_FREETYPE) && RIPPLE_HAS_FREETYPE)
    (void)text;
    (void)font_px;
    (void)out;
    return false;
#else
    if (!ensure_face() ||
        FT_Set_Pixel_Sizes(face_, 0, static_cast<FT_UInt>(font_px)) != 0) {
      return false;
    }

    const int ascent = static_cast<int>(face_->size->metrics.ascender >> 6);
    const int descent = static_cast<int>(-face_->size->metrics.descender >> 6);
    const int h = std::max(1, ascent + descent);

    int w = 0;
    for (char ch : text) {
      const auto cp = static_cast<unsigned char>(ch) < 0x80
                          ? static_cast<FT_ULong>(ch)
                          : static_cast<FT_ULong>('?');
      if (FT_Load_Char(face_, cp, FT_LOAD_DEFAULT) == 0) {
        w += static_cast<int>(face_->glyph->advance.x >> 6);
      }
    }
    w = std::max(1, w);

    std::vector<std::uint8_t> pixels(static_cast<std::size_t>(w) *
                                         static_cast<std::size_t>(h),
                                     0);
    int pen = 0;
    for (char ch : text) {
      const auto cp = static_cast<unsigned char>(ch) < 0x80
                          ? static_cast<FT_ULong>(ch)
                          : static_cast<FT_ULong>('?');
      if (FT_Load_Char(face_, cp, FT_LOAD_RENDER) != 0) {
        continue;
      }
      const auto &bm = face_->glyph->bitmap;
      const int x0 = pen + face_->glyph->bitmap_left;
      const int y0 = ascent - face_->glyph->bitmap_top;
      for (int y = 0; y < static_cast<int>(bm.rows); ++y) {
        const int dy = y0 + y;
        if (dy < 0 || dy >= h) {
          continue;
        }
        for (int x = 0; x < static_cast<int>(bm.width); ++x) {
          const int dx = x0 + x;
          if (dx < 0 || dx >= w) {
            continue;
          }
          auto &dst = pixels[static_cast<std::size_t>(dy) * w + dx];
          dst = std::max(dst, bm.buffer[y * bm.pitch + x]);
        }
      }
      pen += static_cast<int>(face_->glyph->advance.x >> 6);
    }

    GLuint tex = 0;
    glGenTextures(1, &tex);
    if (tex == 0) {
      return false;
    }
    glBindTexture(GL_TEXTURE_2D, tex);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_ALPHA, w, h, 0, GL_ALPHA,
                 GL_UNSIGNED_BYTE, pixels.data());
    out = GLTextEntry{tex, w, h};
    return true;
#endif
  }

#if defined(RIPPLE_HAS_FREETYPE) && RIPPLE_HAS_FREETYPE
  bool ensure_face() {
    if (face_) {
      return true;
    }
    if (!ft_ && FT_Init_FreeType(&ft_) != 0) {
      ft_ = nullptr;
      return false;
    }
    const auto path = readable_font_path();
    if (path.empty() || FT_New_Face(ft_, path.c_str(), 0, &face_) != 0) {
      face_ = nullptr;
      return false;
    }
    return true;
  }

  FT_Library ft_{};
  FT_Face face_{};
#endif

  std::unordered_map<std::string, GLTextEntry> cache_;
};

struct Box {
  NodeHandle node{};
  float x{};
  float y{};
  float w{};
  float h{};
  int font_px{16};
};

// Block layout over the live tree: children stack vertically unless the
// element carries layout=row.
class LiveLayout {
public:
  explicit LiveLayout(const MemoryBackend &backend) : backend_{backend} {}

  const std::vector<Box> &run(NodeHandle root, float x, float y) {
    boxes_.clear();
    place(root, x, y, 16);
    return boxes_;
  }

private:
  static constexpr float kSpacing = 8.0f;

  static float padding_for(const std::string &tag) {
    return tag == "button" || tag == "li" ? 6.0f : 0.0f;
  }

  std::pair<float, float> place(NodeHandle node, float x, float y,
                                int font_px) {
    const auto index = boxes_.size();
    boxes_.push_back(Box{node, x, y, 0.0f, 0.0f, font_px});

    if (backend_.is_text(node)) {
      const auto &t = backend_.text(node);
      const float w = static_cast<float>(t.size()) * font_px * 0.55f;
      const float h = static_cast<float>(font_px) * 1.3f;
      boxes_[index].w = w;
      boxes_[index].h = h;
      return {w, h};
    }

    const auto &tag = backend_.tag(node);
    if (tag == "h1") {
      font_px = 28;
    }
    const auto &attrs = backend_.attributes(node);
    const auto layout = attrs.find("layout");
    const bool row = layout != attrs.end() && layout->second == "row";
    const float pad = padding_for(tag);

    float cx = x + pad;
    float cy = y + pad;
    float w = 0.0f;
    float h = 0.0f;
    bool first = true;
    for (const auto child : backend_.child_list(node)) {
      if (!std::exchange(first, false)) {
        if (row) {
          cx += kSpacing;
        } else {
          cy += kSpacing;
        }
      }
      const auto [cw, ch] = place(child, cx, cy, font_px);
      if (row) {
        cx += cw;
        w = cx - (x + pad);
        h = std::max(h, ch);
      } else {
        cy += ch;
        h = cy - (y + pad);
        w = std::max(w, cw);
      }
    }

    boxes_[index].w = w + pad * 2.0f;
    boxes_[index].h = h + pad * 2.0f;
    return {boxes_[index].w, boxes_[index].h};
  }

  const MemoryBackend &backend_;
  std::vector<Box> boxes_;
};

static bool has_class(const MemoryBackend &backend, NodeHandle node,
                      const std::string &cls) {
  for (auto cur = node; cur != kNoNode; cur = backend.parent(cur)) {
    if (backend.is_text(cur)) {
      continue;
    }
    const auto &attrs = backend.attributes(cur);
    const auto it = attrs.find("class");
    if (it != attrs.end() && it->second == cls) {
      return true;
    }
  }
  return false;
}

static void draw_quad(float x0, float y0, float x1, float y1, Rgba c) {
  glDisable(GL_TEXTURE_2D);
  glColor4ub(c.r, c.g, c.b, c.a);
  glBegin(GL_TRIANGLES);
  glVertex2f(x0, y0);
  glVertex2f(x1, y0);
  glVertex2f(x0, y1);
  glVertex2f(x0, y1);
  glVertex2f(x1, y0);
  glVertex2f(x1, y1);
  glEnd();
}

static void draw_text(GLTextCache &cache, const Box &b, const std::string &t,
                      Rgba c) {
  const auto *entry = cache.get(t, b.font_px);
  if (!entry || entry->texture == 0) {
    return;
  }
  const float x0 = b.x;
  const float y0 = b.y + (b.h - static_cast<float>(entry->h)) * 0.5f;
  const float x1 = x0 + static_cast<float>(entry->w);
  const float y1 = y0 + static_cast<float>(entry->h);

  glEnable(GL_BLEND);
  glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
  glEnable(GL_TEXTURE_2D);
  glBindTexture(GL_TEXTURE_2D, entry->texture);
  glTexEnvi(GL_TEXTURE_ENV, GL_TEXTURE_ENV_MODE, GL_MODULATE);
  glColor4ub(c.r, c.g, c.b, c.a);
  glBegin(GL_TRIANGLES);
  glTexCoord2f(0.0f, 0.0f);
  glVertex2f(x0, y0);
  glTexCoord2f(1.0f, 0.0f);
  glVertex2f(x1, y0);
  glTexCoord2f(0.0f, 1.0f);
  glVertex2f(x0, y1);
  glTexCoord2f(0.0f, 1.0f);
  glVertex2f(x0, y1);
  glTexCoord2f(1.0f, 0.0f);
  glVertex2f(x1, y0);
  glTexCoord2f(1.0f, 1.0f);
  glVertex2f(x1, y1);
  glEnd();
}

static void draw_live_tree(const MemoryBackend &backend,
                           const std::vector<Box> &boxes, GLTextCache &cache) {
  for (const auto &b : boxes) {
    if (backend.is_text(b.node)) {
      const bool dim = has_class(backend, b.node, "done");
      draw_text(cache, b, backend.text(b.node),
                dim ? Rgba{130, 130, 130} : Rgba{230, 230, 230});
      continue;
    }
    if (backend.tag(b.node) == "button") {
      const bool selected = has_class(backend, b.node, "selected");
      draw_quad(b.x, b.y, b.x + b.w, b.y + b.h,
                selected ? Rgba{70, 120, 210} : Rgba{58, 58, 58});
    }
  }
}

struct InputCtx {
  MemoryBackend *backend{};
  const std::vector<Box> *boxes{};
};

// Deepest box under the cursor, then bubble "click" up the parent chain
// until some element has a listener for it.
static void mouse_button_cb(GLFWwindow *win, int button, int action,
                            int mods) {
  (void)mods;
  if (button != GLFW_MOUSE_BUTTON_LEFT || action != GLFW_RELEASE) {
    return;
  }
  auto *ctx = static_cast<InputCtx *>(glfwGetWindowUserPointer(win));
  if (!ctx || !ctx->backend || !ctx->boxes) {
    return;
  }

  double xpos = 0.0;
  double ypos = 0.0;
  glfwGetCursorPos(win, &xpos, &ypos);
  int ww = 0;
  int wh = 0;
  glfwGetWindowSize(win, &ww, &wh);
  int fbw = 0;
  int fbh = 0;
  glfwGetFramebufferSize(win, &fbw, &fbh);
  const float x = static_cast<float>(
      xpos * (ww > 0 ? static_cast<double>(fbw) / ww : 1.0));
  const float y = static_cast<float>(
      ypos * (wh > 0 ? static_cast<double>(fbh) / wh : 1.0));

  const auto &boxes = *ctx->boxes;
  for (auto it = boxes.rbegin(); it != boxes.rend(); ++it) {
    if (x < it->x || y < it->y || x > it->x + it->w || y > it->y + it->h) {
      continue;
    }
    for (auto cur = it->node; cur != kNoNode; cur = ctx->backend->parent(cur)) {
      if (!ctx->backend->is_text(cur) && ctx->backend->dispatch(cur, "click")) {
        return;
      }
    }
    return;
  }
}

int main() {
  if (!glfwInit()) {
    std::cerr << "ripple_gpu_demo: glfwInit failed\n";
    return 1;
  }

  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 2);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 1);

  GLFWwindow *win =
      glfwCreateWindow(640, 480, "ripple_gpu_demo (OpenGL)", nullptr, nullptr);
  if (!win) {
    std::cerr << "ripple_gpu_demo: could not open a window\n";
    glfwTerminate();
    return 1;
  }

  glfwMakeContextCurrent(win);
  // vsync is the frame pacing: one loop frame per swap.
  glfwSwapInterval(1);

  MemoryBackend backend;
  const auto root = backend.create_root("body");
  ManualPacer pacer;

  auto app = mount(backend, root, TodoState{}, todo_update, todo_view, pacer);
  app.enqueue(msg("add", "click done to finish"));
  app.enqueue(msg("add", "click x to remove"));
  app.enqueue(msg("add", "use the filters below"));

  LiveLayout layout{backend};
  std::vector<Box> boxes;

  InputCtx input;
  input.backend = &backend;
  input.boxes = &boxes;
  glfwSetWindowUserPointer(win, &input);
  glfwSetMouseButtonCallback(win, mouse_button_cb);

  {
    GLTextCache text_cache;

    while (!glfwWindowShouldClose(win)) {
      glfwPollEvents();
      pacer.run_frame();

      int fbw = 0;
      int fbh = 0;
      glfwGetFramebufferSize(win, &fbw, &fbh);
      fbw = std::max(1, fbw);
      fbh = std::max(1, fbh);

      boxes = layout.run(root, 24.0f, 24.0f);

      gl_set_ortho(fbw, fbh);
      glDisable(GL_DEPTH_TEST);
      glClearColor(0.1f, 0.1f, 0.1f, 1.0f);
      glClear(GL_COLOR_BUFFER_BIT);
      draw_live_tree(backend, boxes, text_cache);

      glfwSwapBuffers(win);
    }
  }

  glfwDestroyWindow(win);
  glfwTerminate();
  return 0;
}

#endif
