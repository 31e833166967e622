#include <benchmark/benchmark.h>

#include "corpus_generator.hpp"
#include "omd/core/frontmatter.hpp"
#include "omd/core/inline_metadata.hpp"
#include "omd/core/note.hpp"

using namespace omd::core;
using namespace omd::test;

// Benchmark frontmatter parsing
static void BM_FrontmatterParse(benchmark::State& state) {
  CorpusGenerator generator({.note_count = 100});
  auto corpus = generator.generateCorpus();

  size_t index = 0;
  for (auto _ : state) {
    auto result = Frontmatter::parse(corpus[index % corpus.size()]);
    benchmark::DoNotOptimize(result);
    ++index;
  }
}
BENCHMARK(BM_FrontmatterParse);

// Benchmark inline field scanning
static void BM_InlineScan(benchmark::State& state) {
  CorpusGenerator generator({.note_count = 100, .paragraphs = static_cast<size_t>(state.range(0))});
  auto corpus = generator.generateCorpus();

  size_t index = 0;
  for (auto _ : state) {
    auto fields = InlineMetadata::scan(corpus[index % corpus.size()]);
    benchmark::DoNotOptimize(fields);
    ++index;
  }
}
BENCHMARK(BM_InlineScan)->Arg(8)->Arg(64)->Arg(256);

// Benchmark full note parsing
static void BM_NoteParse(benchmark::State& state) {
  CorpusGenerator generator({.note_count = 100});
  auto corpus = generator.generateCorpus();

  size_t index = 0;
  for (auto _ : state) {
    Note note(corpus[index % corpus.size()]);
    auto result = note.parse();
    benchmark::DoNotOptimize(result);
    ++index;
  }
}
BENCHMARK(BM_NoteParse);

// Benchmark move + recompose for each composition mode
static void BM_MoveAndCompose(benchmark::State& state) {
  CorpusGenerator generator({.note_count = 100, .callout = state.range(1) != 0});
  auto corpus = generator.generateCorpus();

  ComposeOptions options;
  options.inline_inplace = state.range(0) != 0;
  options.inline_template = state.range(1) != 0 ? InlineTemplate::kCallout
                                                : InlineTemplate::kStandard;

  size_t index = 0;
  for (auto _ : state) {
    state.PauseTiming();
    Note note(corpus[index % corpus.size()]);
    auto parsed = note.parse();
    benchmark::DoNotOptimize(parsed);
    state.ResumeTiming();

    auto moved = note.move({"tags"}, MetadataKind::kFrontmatter, MetadataKind::kInline);
    benchmark::DoNotOptimize(moved);
    auto content = note.updateContent(options);
    benchmark::DoNotOptimize(content);
    ++index;
  }
}
BENCHMARK(BM_MoveAndCompose)->Args({1, 0})->Args({0, 0})->Args({0, 1});

// Benchmark corpus batch operation without I/O
static void BM_CorpusDedupe(benchmark::State& state) {
  CorpusGenerator generator({.note_count = static_cast<size_t>(state.range(0))});
  auto corpus = generator.generateCorpus();

  for (auto _ : state) {
    size_t changed = 0;
    for (const auto& text : corpus) {
      Note note(text);
      if (!note.parse().has_value()) {
        continue;
      }
      auto deduped = note.removeDuplicateValues({}, MetadataKind::kAll);
      benchmark::DoNotOptimize(deduped);
      auto content = note.updateContent();
      if (content.has_value() && *content != text) {
        ++changed;
      }
    }
    benchmark::DoNotOptimize(changed);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_CorpusDedupe)->Arg(100)->Arg(1000);

BENCHMARK_MAIN();
