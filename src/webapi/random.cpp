#include "random.h"

#include <random>

#include "platform_util.h"

namespace webapi {
namespace correlation {
namespace {

extern "C" void on_fork();

class Uint64Generator {
  std::mt19937_64 generator_;
  std::uniform_int_distribution<std::uint64_t> distribution_;

 public:
  Uint64Generator() {
    seed_with_random();
    // If a process links to this library and then calls `fork`, the
    // `generator_` in the parent and child processes would produce the exact
    // same sequence of values, and so the same trace and span IDs.  Prefork
    // servers usually don't `exec` after forking their workers, so reseed
    // `generator_` in the child process.
    (void)at_fork_in_child(&on_fork);
  }

  std::uint64_t operator()() { return distribution_(generator_); }

  void seed_with_random() {
    std::random_device device;
    std::seed_seq seed{device(), device(), device(), device()};
    generator_.seed(seed);
  }
};

thread_local Uint64Generator thread_local_generator;

void on_fork() { thread_local_generator.seed_with_random(); }

}  // namespace

std::uint64_t random_uint64() { return thread_local_generator(); }

}  // namespace correlation
}  // namespace webapi
