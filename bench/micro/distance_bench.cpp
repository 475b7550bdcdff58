#include <benchmark/benchmark.h>
#include <cairn/kernels/distance.hpp>
#include <vector>

using namespace cairn::kernels;

static void BenchL2Sq(benchmark::State& state){
  const auto dim = static_cast<std::size_t>(state.range(0));
  std::vector<float> a(dim), b(dim);
  for (std::size_t i=0;i<dim;++i){ a[i]=i*1.0f; b[i]=(dim-1-i)*1.0f; }
  for (auto _ : state) {
    benchmark::DoNotOptimize(l2_sq(a, b));
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BenchL2Sq)->Arg(64)->Arg(384)->Arg(1536);

static void BenchIP128(benchmark::State& state){
  std::vector<float> a(128), b(128);
  for (int i=0;i<128;++i){ a[i]=i*0.5f; b[i]=(127-i)*0.25f; }
  for (auto _ : state) {
    benchmark::DoNotOptimize(inner_product(a, b));
  }
}
BENCHMARK(BenchIP128);

static void BenchCosineDispatch(benchmark::State& state){
  std::vector<float> a(384), b(384);
  for (int i=0;i<384;++i){ a[i]=1.0f+i*0.01f; b[i]=2.0f-i*0.005f; }
  for (auto _ : state) {
    benchmark::DoNotOptimize(distance(Metric::cosine, a, b));
  }
}
BENCHMARK(BenchCosineDispatch);
