#include "text_layout.hpp"
#include "panel.hpp"
#include "headless_terminal.hpp"
#include <string>
#include <vector>
#include <chrono>
#include <iostream>
#include <random>
#include <cstdlib>

struct BenchCfg {
  int words = 200000;     // words in the generated text
  int iters = 20;         // layout passes per policy
  int width = 80;
  int panel_children = 2000;
  int panel_iters = 50;
};

static std::string make_text(int words) {
  std::mt19937 rng(12345);
  std::uniform_int_distribution<int> len(1, 12);
  std::uniform_int_distribution<int> nl(0, 40);
  std::string s;
  for (int i = 0; i < words; ++i) {
    s.append(static_cast<size_t>(len(rng)), static_cast<char>('a' + i % 26));
    s.push_back(nl(rng) == 0 ? '\n' : ' ');
  }
  return s;
}

static void bench_policies(const BenchCfg& cfg) {
  std::string text = make_text(cfg.words);
  for (WrapPolicy p : {WrapPolicy::Truncate, WrapPolicy::WrapExact, WrapPolicy::WrapWords}) {
    std::vector<Line> lines;
    std::string msg;
    auto t0 = std::chrono::steady_clock::now();
    for (int i = 0; i < cfg.iters; ++i) {
      if (!compute_lines(text, cfg.width, p, lines, msg)) { std::cout << msg << "\n"; return; }
    }
    auto t1 = std::chrono::steady_clock::now();
    std::chrono::duration<double> dt = t1 - t0;
    std::cout << "[" << policy_name(p) << "] bytes=" << text.size() << " iters=" << cfg.iters
              << " lines=" << lines.size() << " took " << dt.count() << "s\n";
  }
}

// height pass + render pass per child, so every text is laid out twice
static void bench_panel(const BenchCfg& cfg) {
  PanelBuilder b;
  b.title("bench");
  for (int i = 0; i < cfg.panel_children; ++i) b.add_text(make_text(40));
  Panel panel = b.build();
  HeadlessTerminal term(60, cfg.width);
  std::string msg;
  auto t0 = std::chrono::steady_clock::now();
  for (int i = 0; i < cfg.panel_iters; ++i) {
    if (!panel.render(term, Rect{0, 0, 60, cfg.width}, msg)) { std::cout << msg << "\n"; return; }
  }
  auto t1 = std::chrono::steady_clock::now();
  std::chrono::duration<double> dt = t1 - t0;
  std::cout << "[panel]  children=" << cfg.panel_children << " iters=" << cfg.panel_iters
            << " took " << dt.count() << "s\n";
}

int main(int argc, char** argv) {
  BenchCfg cfg;
  if (argc > 1) {
    int w = std::atoi(argv[1]);
    if (w > 0) cfg.width = w;
  }
  bench_policies(cfg);
  bench_panel(cfg);
  return 0;
}
