#include "stdio_stream.hpp"

#include <cstddef>

#include "scheduler_context.hpp"

using bee::FileDescriptor;
using std::string;
using std::weak_ptr;

namespace aspawn {
namespace {

constexpr size_t read_chunk_size = 16 * 1024;

} // namespace

////////////////////////////////////////////////////////////////////////////////
// ReadableStream
//

ReadableStream::ReadableStream(FileDescriptor::shared_ptr&& fd)
    : _fd(std::move(fd))
{}

ReadableStream::~ReadableStream()
{
  if (_fd == nullptr) { return; }
  remove_fd(_fd);
  _fd->close();
}

bee::OrError<ReadableStream::ptr> ReadableStream::of_fd(
  FileDescriptor::shared_ptr&& fd)
{
  bail_unit(fd->set_blocking(false));

  auto stream = ptr(new ReadableStream(std::move(fd)));

  bail_unit(add_fd(stream->_fd, [weak = weak_ptr(stream)]() {
    if (auto self = weak.lock()) { self->_read_available(); }
  }));

  return stream;
}

ListenerId ReadableStream::on_data(data_listener&& listener)
{
  auto id = _data_listeners.add(std::move(listener));
  resume();
  return id;
}

ListenerId ReadableStream::on_end(event_listener&& listener)
{
  return _end_listeners.add(std::move(listener));
}

ListenerId ReadableStream::on_close(event_listener&& listener)
{
  return _close_listeners.add(std::move(listener));
}

ListenerId ReadableStream::on_error(error_listener&& listener)
{
  return _error_listeners.add(std::move(listener));
}

void ReadableStream::pause() { _flowing = false; }

void ReadableStream::resume()
{
  if (_flowing || _fd == nullptr) { return; }
  _flowing = true;
  // Readiness is edge triggered, so data that arrived while paused is only
  // picked up by reading again.
  schedule([weak = weak_from_this()]() {
    if (auto self = weak.lock()) { self->_read_available(); }
  });
}

void ReadableStream::pipe(const std::shared_ptr<WritableStream>& dest)
{
  auto weak = weak_from_this();
  dest->on_drain([weak]() {
    if (auto self = weak.lock()) { self->resume(); }
  });
  on_end([dest]() { dest->end(); });
  on_data([weak, dest](const string& chunk) {
    if (dest->write(chunk)) { return; }
    if (auto self = weak.lock()) { self->pause(); }
  });
}

void ReadableStream::destroy()
{
  if (_fd == nullptr) { return; }
  auto self = shared_from_this();
  _close();
}

void ReadableStream::_read_available()
{
  auto self = shared_from_this();
  std::byte buffer[read_chunk_size];
  while (_flowing && _fd != nullptr) {
    auto result = _fd->read(buffer, sizeof(buffer));
    if (result.is_error()) {
      _error_listeners.emit(result.error());
      _close();
      return;
    }
    size_t bytes_read = result.value().bytes_read();
    if (bytes_read > 0) {
      _data_listeners.emit(
        string(reinterpret_cast<const char*>(buffer), bytes_read));
    } else {
      if (result.value().is_eof()) {
        _ended = true;
        _end_listeners.emit();
        _close();
      }
      return;
    }
  }
}

void ReadableStream::_close()
{
  if (_fd == nullptr) { return; }
  remove_fd(_fd);
  _fd->close();
  _fd = nullptr;
  _flowing = false;

  _close_listeners.emit();

  // Nothing fires after close; dropping the listeners also releases whatever
  // they captured.
  _data_listeners.clear();
  _end_listeners.clear();
  _close_listeners.clear();
  _error_listeners.clear();
}

////////////////////////////////////////////////////////////////////////////////
// WritableStream
//

WritableStream::WritableStream(FileDescriptor::shared_ptr&& fd)
    : _fd(std::move(fd))
{}

WritableStream::~WritableStream()
{
  if (_fd == nullptr) { return; }
  remove_fd(_fd);
  _fd->close();
}

bee::OrError<WritableStream::ptr> WritableStream::of_fd(
  FileDescriptor::shared_ptr&& fd)
{
  bail_unit(fd->set_blocking(false));

  auto stream = ptr(new WritableStream(std::move(fd)));

  bail_unit(add_fd(stream->_fd, [weak = weak_ptr(stream)]() {
    auto self = weak.lock();
    if (self == nullptr || self->_fd == nullptr || self->_corked) { return; }
    self->_after_write_attempt(self->_flush());
  }));

  return stream;
}

bool WritableStream::write(const string& data)
{
  if (_fd == nullptr || _ending) { return false; }
  _outgoing.write(data);
  if (!_corked) {
    auto self = shared_from_this();
    _after_write_attempt(_flush());
    if (_fd == nullptr) { return false; }
  }
  if (_outgoing.size() >= high_water_mark) {
    _needs_drain = true;
    return false;
  }
  return true;
}

void WritableStream::end()
{
  if (_fd == nullptr || _ending) { return; }
  _ending = true;
  _corked = false;
  auto self = shared_from_this();
  _after_write_attempt(_flush());
}

void WritableStream::cork() { _corked = true; }

void WritableStream::uncork()
{
  if (!_corked) { return; }
  _corked = false;
  if (_fd == nullptr) { return; }
  auto self = shared_from_this();
  _after_write_attempt(_flush());
}

void WritableStream::destroy()
{
  if (_fd == nullptr) { return; }
  auto self = shared_from_this();
  _outgoing.consume(_outgoing.size());
  _close();
}

ListenerId WritableStream::on_drain(event_listener&& listener)
{
  return _drain_listeners.add(std::move(listener));
}

ListenerId WritableStream::on_finish(event_listener&& listener)
{
  return _finish_listeners.add(std::move(listener));
}

ListenerId WritableStream::on_close(event_listener&& listener)
{
  return _close_listeners.add(std::move(listener));
}

ListenerId WritableStream::on_error(error_listener&& listener)
{
  return _error_listeners.add(std::move(listener));
}

bee::OrError<> WritableStream::_flush()
{
  size_t bytes_sent = 0;
  for (auto& block : _outgoing) {
    if (block.empty()) { continue; }
    size_t block_bytes_sent = 0;
    while (block_bytes_sent < block.size()) {
      bail(
        ret,
        _fd->write(
          block.data() + block_bytes_sent, block.size() - block_bytes_sent));
      if (ret == 0) { break; }
      block_bytes_sent += ret;
    }
    bytes_sent += block_bytes_sent;
    if (block_bytes_sent < block.size()) { break; }
  }
  _outgoing.consume(bytes_sent);
  return bee::ok();
}

void WritableStream::_after_write_attempt(bee::OrError<>&& result)
{
  if (result.is_error()) {
    _error_listeners.emit(result.error());
    _outgoing.consume(_outgoing.size());
    _close();
    return;
  }
  if (!_outgoing.empty()) { return; }
  if (_needs_drain) {
    _needs_drain = false;
    _drain_listeners.emit();
  }
  if (_ending && _fd != nullptr) {
    _finish_listeners.emit();
    _close();
  }
}

void WritableStream::_close()
{
  if (_fd == nullptr) { return; }
  remove_fd(_fd);
  _fd->close();
  _fd = nullptr;

  _close_listeners.emit();

  _drain_listeners.clear();
  _finish_listeners.clear();
  _close_listeners.clear();
  _error_listeners.clear();
}

} // namespace aspawn
