#include <flagon/flagon.hpp>

#include <iostream>
#include <string>

#ifndef HELLO_NAME
#define HELLO_NAME "hello"
#endif

#ifndef HELLO_VERSION
#define HELLO_VERSION "0.0.0"
#endif

namespace
{
  constexpr int32_t MAX_TIMES = 100;

  // message in a speech bubble, with a crab underneath
  void say(const std::string& message)
  {
    const std::string border(message.size() + 2, '-');
    std::cout << " " << border << "\n";
    std::cout << "< " << message << " >\n";
    std::cout << " " << border << "\n";
    std::cout << "        \\\n";
    std::cout << "         \\\n";
    std::cout << "            _~^~^~_\n";
    std::cout << "        \\) /  o o  \\ (/\n";
    std::cout << "          '_   -   _'\n";
    std::cout << "          / '-----' \\\n";
  }
} // namespace

int main(int argc, char** argv)
{
  int status = 0;
  flagon::command cmd({ HELLO_NAME, HELLO_VERSION }, "gives a friendly hello",
                      "hello TEXT",
    [&status](std::optional<std::string> text, const flagon::command::flag_list& flags)
    {
      bool use_ferris = false;
      int32_t times = 1;
      for(const flagon::flag_spec& flag : flags)
      {
        if(flagon::matches(flag, "-f"))
          use_ferris = flag.value.get<bool>().value_or(false);
        else if(flagon::matches(flag, "-n"))
          times = flag.value.get<int32_t>().value_or(1);
      }

      if(times < 1 || times > MAX_TIMES)
      {
        std::cerr << std::format("error: --times must be between 1 and {}, got {}\n",
                                 MAX_TIMES, times);
        status = 1;
        return;
      }

      const auto message = std::format("hello, {}!", text.value_or("world"));
      for(int32_t i = 0; i < times; ++i)
      {
        if(use_ferris)
          say(message);
        else
          std::cout << message << "\n";
      }
    });

  if(auto added = cmd.add_flag(flagon::make_bool("f", "ferris", "say hello from ferris")); !added)
  {
    std::cerr << "error: " << added.error().message << "\n";
    return 1;
  }
  if(auto added = cmd.add_flag(flagon::make_int("n", "times", "repeat the greeting", 1)); !added)
  {
    std::cerr << "error: " << added.error().message << "\n";
    return 1;
  }

  const int code = cmd.run(argc, argv);
  return code != 0 ? code : status;
}
