// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "server.hh"
#include "binding.hh"
#include "platform.hh"
#include "testing.hh"
#include "utils.hh"
#include "internal.hh"
#include <sys/stat.h>
#include <signal.h>
#include <fcntl.h>
#include <unistd.h>
#include <cstring>
#include <cerrno>

namespace Tether {

// == MainConfig and arguments ==
struct MainConfig {
  String  input, output;
  String  log_file;
  String  repr_style = "default";
  String  repr_module;
  StringS includes;
  StringS args;
  bool    log_ipc = false;
  bool    promote_warnings = true;
  bool    fatal_warnings = false;
  enum ModeT { SERVE, CHECK_INTEGRITY_TESTS };
  ModeT   mode = SERVE;
};

static void
print_usage (bool help)
{
  if (!help)
    {
      printout ("%s version %s\n", executable_name(), tether_version());
      return;
    }
  printout ("Usage: %s [OPTIONS] [INPUT [OUTPUT]] [-- ARGS...]\n", executable_name());
  printout ("  --check          Run integrity tests\n");
  printout ("  --fatal-warnings Abort on warnings and failing assertions\n");
  printout ("  --help           Print program usage and options\n");
  printout ("  --include <file> Evaluate a command script before serving\n");
  printout ("  --log-file <file> Write diagnostics to <file>\n");
  printout ("  --log-ipc        Print requests and responses\n");
  printout ("  --no-promote-warnings Report runtime warnings instead of raising ErrorException\n");
  printout ("  --repr-module <name> Prefix class names in representations with <name>\n");
  printout ("  --repr-style <style> Representation style: default, python\n");
  printout ("  --version        Print program version\n");
}

static MainConfig
parse_args (int argc, char **argv)
{
  MainConfig config;
  StringS positionals;
  bool sep = false; // -- separator
  for (int i = 1; i < argc; i++)
    {
      if (sep)
        config.args.push_back (argv[i]);
      else if (strcmp (argv[i], "--fatal-warnings") == 0)
        config.fatal_warnings = true;
      else if (strcmp ("--check", argv[i]) == 0)
        {
          config.mode = MainConfig::CHECK_INTEGRITY_TESTS;
          config.fatal_warnings = true;
        }
      else if (strcmp ("--log-ipc", argv[i]) == 0)
        config.log_ipc = true;
      else if (strcmp ("--no-promote-warnings", argv[i]) == 0)
        config.promote_warnings = false;
      else if (argv[i] == String ("--log-file") && i + 1 < argc)
        config.log_file = argv[++i];
      else if (argv[i] == String ("--include") && i + 1 < argc)
        config.includes.push_back (argv[++i]);
      else if (argv[i] == String ("--repr-style") && i + 1 < argc)
        {
          config.repr_style = argv[++i];
          if (config.repr_style != "default" && config.repr_style != "python")
            fatal_error ("invalid representation style: %s", config.repr_style);
        }
      else if (argv[i] == String ("--repr-module") && i + 1 < argc)
        config.repr_module = argv[++i];
      else if (strcmp ("-h", argv[i]) == 0 ||
               strcmp ("--help", argv[i]) == 0)
        {
          print_usage (true);
          exit (0);
        }
      else if (strcmp ("--version", argv[i]) == 0)
        {
          print_usage (false);
          exit (0);
        }
      else if (argv[i] == String ("--") && !sep)
        sep = true;
      else if (argv[i][0] == '-' && argv[i][1] && !sep)
        fatal_error ("invalid command line argument: %s", argv[i]);
      else
        positionals.push_back (argv[i]);
    }
  if (config.mode == MainConfig::CHECK_INTEGRITY_TESTS)
    config.args.insert (config.args.begin(), positionals.begin(), positionals.end());
  else
    {
      if (positionals.size() > 2)
        fatal_error ("too many arguments: %s", positionals[2]);
      if (positionals.size() > 0 && positionals[0] != "-")
        config.input = positionals[0];
      if (positionals.size() > 1 && positionals[1] != "-")
        config.output = positionals[1];
    }
  return config;
}

static bool
same_file (int fd1, int fd2)
{
  struct stat st1 = {}, st2 = {};
  return_unless (fd1 >= 0 && fd2 >= 0, false);
  return_unless (fstat (fd1, &st1) == 0 && fstat (fd2, &st2) == 0, false);
  return st1.st_dev == st2.st_dev && st1.st_ino == st2.st_ino;
}

static int
serve (const MainConfig &config)
{
  std::unique_ptr<Transport> transport;
  try {
    if (config.input.empty() && config.output.empty())
      transport = std::make_unique<FdTransport> (STDIN_FILENO, STDOUT_FILENO);
    else
      transport = std::make_unique<FdTransport> (config.input.empty() ? "/dev/stdin" : config.input,
                                                 config.output.empty() ? "/dev/stdout" : config.output);
  } catch (const ConnectionLost &exc) {
    printerr ("%s: %s\n", executable_name(), exc.what());
    return 1;
  }
  const int response_fd = transport->output_fd();
  // diagnostics and echo output must never interleave with responses
  const bool stderr_is_response = !isatty (STDERR_FILENO) && same_file (STDERR_FILENO, response_fd);
  if (config.log_file.empty() && stderr_is_response)
    diag_redirect (-1);
  Representer representer = config.repr_style == "python" ? Representer (Representer::python_style()) : Representer();
  if (!config.repr_module.empty())
    representer.class_name_hook (Representer::module_path_hook (config.repr_module));
  Runtime runtime;
  if (same_file (STDOUT_FILENO, response_fd))
    runtime.set_output_fd (stderr_is_response ? -1 : STDERR_FILENO);
  runtime.set_global ("argv", Convert<StringS>::to_value (config.args));
  if (config.promote_warnings)
    Runtime::promote_warnings();
  CommandServer server (*transport, runtime, representer);
  if (config.log_ipc)
    server.log_ipc (true);
  try {
    for (const String &include : config.includes)
      {
        Runtime::Scope scope (runtime);
        runtime.include_file (include, true, false);
      }
  } catch (const std::exception &exc) {
    printerr ("%s: %s: %s\n", executable_name(), exception_kind (exc), exc.what());
    return 1;
  } catch (const SessionExit &session_exit) {
    return session_exit.status;
  }
  try {
    server.run();
  } catch (const ConnectionLost &exc) {
    debug ("ipc", "connection lost: %s", exc.what());
  } catch (const SessionExit &session_exit) {
    debug ("ipc", "session exit: %d", session_exit.status);
    return session_exit.status;
  }
  return 0;
}

} // Tether

static void
init_sigpipe()
{
  // report EPIPE from write() instead of dying when the controlling process goes away
  sigset_t signal_mask;
  sigemptyset (&signal_mask);
  sigaddset (&signal_mask, SIGPIPE);
  const int rc = pthread_sigmask (SIG_BLOCK, &signal_mask, NULL);
  if (rc != 0)
    Tether::warning ("Tether: pthread_sigmask for SIGPIPE failed: %s\n", strerror (errno));
}

int
main (int argc, char *argv[])
{
  using namespace Tether;
  init_sigpipe();
  const MainConfig config = parse_args (argc, argv);
  if (config.fatal_warnings)
    diag_fatal_warnings (true);
  if (!config.log_file.empty())
    {
      const int fd = open (config.log_file.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
      if (fd < 0)
        fatal_error ("%s: %s", config.log_file, strerror (errno));
      diag_redirect (fd);
    }
  if (config.mode == MainConfig::CHECK_INTEGRITY_TESTS)
    {
      printerr ("CHECK_INTEGRITY_TESTS…\n");
      const int n = Test::run (config.args);
      printerr ("%d integrity tests passed\n", n);
      return 0;
    }
  return serve (config);
}
