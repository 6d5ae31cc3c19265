#pragma once

#include <cstddef>

std::size_t constexpr start_entities = 1024;
std::size_t constexpr num_entities = 64 * start_entities;

#define CLAN_BENCHMARK_ONE(x) BENCHMARK(x)->Arg(1)
#define CLAN_BENCHMARK(x) BENCHMARK(x)->RangeMultiplier(8)->Range(start_entities, num_entities)
