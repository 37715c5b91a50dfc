#pragma once

#include <functional>
#include <memory>
#include <string>

#include "listeners.hpp"

#include "bee/data_buffer.hpp"
#include "bee/error.hpp"
#include "bee/file_descriptor.hpp"

namespace aspawn {

struct WritableStream;

////////////////////////////////////////////////////////////////////////////////
// ReadableStream
//
// Non-blocking read end of a pipe. Starts paused; attaching a data listener,
// resume() or pipe() makes it flow.
//

struct ReadableStream : public std::enable_shared_from_this<ReadableStream> {
 public:
  using ptr = std::shared_ptr<ReadableStream>;

  using data_listener = std::function<void(const std::string& chunk)>;
  using event_listener = std::function<void()>;
  using error_listener = std::function<void(const bee::Error& error)>;

  static bee::OrError<ptr> of_fd(bee::FileDescriptor::shared_ptr&& fd);

  ReadableStream(const ReadableStream& other) = delete;
  ReadableStream(ReadableStream&& other) = delete;

  ~ReadableStream();

  ListenerId on_data(data_listener&& listener);
  ListenerId on_end(event_listener&& listener);
  ListenerId on_close(event_listener&& listener);
  ListenerId on_error(error_listener&& listener);

  void pause();
  void resume();

  // Forwards every chunk to dest, pausing while dest is over its high-water
  // mark, and ends dest when this stream ends.
  void pipe(const std::shared_ptr<WritableStream>& dest);

  // Closes the fd without waiting for EOF. Emits close but not end.
  void destroy();

  // True once a data listener is attached, pipe() included.
  bool has_consumer() const { return !_data_listeners.empty(); }

  bool is_flowing() const { return _flowing; }
  bool is_ended() const { return _ended; }
  bool is_closed() const { return _fd == nullptr; }

 private:
  explicit ReadableStream(bee::FileDescriptor::shared_ptr&& fd);

  void _read_available();
  void _close();

  bee::FileDescriptor::shared_ptr _fd;

  Listeners<std::string> _data_listeners;
  Listeners<> _end_listeners;
  Listeners<> _close_listeners;
  Listeners<bee::Error> _error_listeners;

  bool _flowing = false;
  bool _ended = false;
};

////////////////////////////////////////////////////////////////////////////////
// WritableStream
//

struct WritableStream : public std::enable_shared_from_this<WritableStream> {
 public:
  using ptr = std::shared_ptr<WritableStream>;

  using event_listener = std::function<void()>;
  using error_listener = std::function<void(const bee::Error& error)>;

  static constexpr size_t high_water_mark = 16 * 1024;

  static bee::OrError<ptr> of_fd(bee::FileDescriptor::shared_ptr&& fd);

  WritableStream(const WritableStream& other) = delete;
  WritableStream(WritableStream&& other) = delete;

  ~WritableStream();

  // Returns false once the caller should wait for drain before writing more,
  // and always after end() or destroy().
  bool write(const std::string& data);

  void end();

  void cork();
  void uncork();

  void destroy();

  ListenerId on_drain(event_listener&& listener);
  ListenerId on_finish(event_listener&& listener);
  ListenerId on_close(event_listener&& listener);
  ListenerId on_error(error_listener&& listener);

  size_t buffered_size() const { return _outgoing.size(); }
  bool is_corked() const { return _corked; }
  bool is_closed() const { return _fd == nullptr; }

 private:
  explicit WritableStream(bee::FileDescriptor::shared_ptr&& fd);

  bee::OrError<> _flush();
  void _after_write_attempt(bee::OrError<>&& result);
  void _close();

  bee::FileDescriptor::shared_ptr _fd;
  bee::DataBuffer _outgoing;

  Listeners<> _drain_listeners;
  Listeners<> _finish_listeners;
  Listeners<> _close_listeners;
  Listeners<bee::Error> _error_listeners;

  bool _corked = false;
  bool _ending = false;
  bool _needs_drain = false;
};

} // namespace aspawn
