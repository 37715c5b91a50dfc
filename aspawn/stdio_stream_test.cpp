#include <cassert>
#include <string>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

#include "ivar.hpp"
#include "stdio_stream.hpp"
#include "testing.hpp"

using bee::FileDescriptor;
using std::pair;
using std::string;

namespace aspawn {
namespace {

pair<ReadableStream::ptr, WritableStream::ptr> make_pipe()
{
  int fds[2];
  int ret = pipe2(fds, O_CLOEXEC);
  assert(ret == 0);
  must(reader, ReadableStream::of_fd(FileDescriptor(fds[0]).to_shared()));
  must(writer, WritableStream::of_fd(FileDescriptor(fds[1]).to_shared()));
  return {reader, writer};
}

ASPAWN_TEST(write_then_read_until_end)
{
  auto [reader, writer] = make_pipe();

  string received;
  bool ended = false;
  auto closed = Ivar<>::create();
  reader->on_data([&](const string& chunk) { received += chunk; });
  reader->on_end([&]() { ended = true; });
  reader->on_close([closed]() { closed->fill(); });

  auto finished = Ivar<>::create();
  writer->on_finish([finished]() { finished->fill(); });

  assert(writer->write("hello "));
  assert(writer->write("world"));
  writer->end();
  assert(!writer->write("too late"));

  co_await finished;
  assert(writer->is_closed());

  co_await closed;
  assert(ended);
  assert(reader->is_ended());
  assert(received == "hello world");
  P("received: $", received);
}

ASPAWN_TEST(paused_until_data_listener)
{
  auto [reader, writer] = make_pipe();
  assert(!reader->is_flowing());

  assert(writer->write("early"));
  co_await after(bee::Span::of_seconds(0.01));

  auto got = Ivar<string>::create();
  reader->on_data([got](const string& chunk) { got->fill(chunk); });
  assert(reader->is_flowing());

  auto chunk = co_await got;
  assert(chunk == "early");
}

ASPAWN_TEST(high_water_mark_and_drain)
{
  auto [reader, writer] = make_pipe();

  writer->cork();
  string block(WritableStream::high_water_mark / 2, 'x');
  assert(writer->write(block));
  assert(!writer->write(block));
  assert(writer->buffered_size() == WritableStream::high_water_mark);

  auto drained = Ivar<>::create();
  writer->on_drain([drained]() { drained->fill(); });

  size_t received = 0;
  auto closed = Ivar<>::create();
  reader->on_data([&](const string& chunk) { received += chunk.size(); });
  reader->on_close([closed]() { closed->fill(); });

  writer->uncork();
  co_await drained;
  assert(writer->buffered_size() == 0);

  writer->end();
  co_await closed;
  assert(received == WritableStream::high_water_mark);
}

ASPAWN_TEST(pipe_forwards_with_back_pressure)
{
  auto [source_reader, source_writer] = make_pipe();
  auto [sink_reader, sink_writer] = make_pipe();

  source_reader->pipe(sink_writer);

  string received;
  auto closed = Ivar<>::create();
  sink_reader->on_data([&](const string& chunk) { received += chunk; });
  sink_reader->on_close([closed]() { closed->fill(); });

  string payload;
  for (int i = 0; i < 10000; i++) { payload += "line of text\n"; }
  assert(!source_writer->write(payload));
  source_writer->end();

  co_await closed;
  assert(received == payload);
  P("piped $ bytes", received.size());
  assert(sink_writer->is_closed());
}

ASPAWN_TEST(destroy_closes_without_end)
{
  auto [reader, writer] = make_pipe();

  bool ended = false;
  int closes = 0;
  reader->on_end([&]() { ended = true; });
  reader->on_close([&]() { closes++; });

  reader->destroy();
  reader->destroy();
  assert(reader->is_closed());
  assert(!ended);
  assert(closes == 1);

  writer->destroy();
  assert(writer->is_closed());
  co_return;
}

ASPAWN_TEST(write_error_closes_the_stream)
{
  auto [reader, writer] = make_pipe();
  reader->destroy();

  bool got_error = false;
  auto closed = Ivar<>::create();
  writer->on_error([&](const bee::Error&) { got_error = true; });
  writer->on_close([closed]() { closed->fill(); });

  assert(!writer->write("nobody is listening"));
  co_await closed;
  assert(got_error);
  P("write to a closed pipe failed");
}

} // namespace
} // namespace aspawn
