#include "signal_names.hpp"

#include <cerrno>
#include <csignal>
#include <utility>

#include "bee/format.hpp"

using std::optional;
using std::pair;
using std::string;

namespace aspawn {
namespace {

constexpr pair<int, const char*> signals[] = {
  {SIGHUP, "SIGHUP"},   {SIGINT, "SIGINT"},       {SIGQUIT, "SIGQUIT"},
  {SIGILL, "SIGILL"},   {SIGTRAP, "SIGTRAP"},     {SIGABRT, "SIGABRT"},
  {SIGBUS, "SIGBUS"},   {SIGFPE, "SIGFPE"},       {SIGKILL, "SIGKILL"},
  {SIGUSR1, "SIGUSR1"}, {SIGSEGV, "SIGSEGV"},     {SIGUSR2, "SIGUSR2"},
  {SIGPIPE, "SIGPIPE"}, {SIGALRM, "SIGALRM"},     {SIGTERM, "SIGTERM"},
  {SIGCHLD, "SIGCHLD"}, {SIGCONT, "SIGCONT"},     {SIGSTOP, "SIGSTOP"},
  {SIGTSTP, "SIGTSTP"}, {SIGTTIN, "SIGTTIN"},     {SIGTTOU, "SIGTTOU"},
  {SIGURG, "SIGURG"},   {SIGXCPU, "SIGXCPU"},     {SIGXFSZ, "SIGXFSZ"},
  {SIGPROF, "SIGPROF"}, {SIGWINCH, "SIGWINCH"},   {SIGIO, "SIGIO"},
  {SIGSYS, "SIGSYS"},   {SIGVTALRM, "SIGVTALRM"},
};

constexpr pair<int, const char*> errnos[] = {
  {EPERM, "EPERM"},
  {ENOENT, "ENOENT"},
  {EINTR, "EINTR"},
  {EIO, "EIO"},
  {E2BIG, "E2BIG"},
  {ENOEXEC, "ENOEXEC"},
  {EBADF, "EBADF"},
  {EAGAIN, "EAGAIN"},
  {ENOMEM, "ENOMEM"},
  {EACCES, "EACCES"},
  {EFAULT, "EFAULT"},
  {ENOTDIR, "ENOTDIR"},
  {EISDIR, "EISDIR"},
  {EINVAL, "EINVAL"},
  {ENFILE, "ENFILE"},
  {EMFILE, "EMFILE"},
  {ETXTBSY, "ETXTBSY"},
  {EPIPE, "EPIPE"},
  {ENAMETOOLONG, "ENAMETOOLONG"},
  {ELOOP, "ELOOP"},
};

} // namespace

string signal_name(int signo)
{
  for (const auto& [number, name] : signals) {
    if (number == signo) { return name; }
  }
  return F("SIG$", signo);
}

optional<int> signal_number(const string& name)
{
  for (const auto& [number, signal] : signals) {
    if (name == signal) { return number; }
  }
  return std::nullopt;
}

string errno_code(int error_number)
{
  for (const auto& [number, code] : errnos) {
    if (number == error_number) { return code; }
  }
  return F("E$", error_number);
}

} // namespace aspawn
