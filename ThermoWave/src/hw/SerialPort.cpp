#include "SerialPort.h"
#include <cerrno>
#include <cstring>
#include <utility>
#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>
#include "../utils/Logger.hpp"

namespace {

speed_t baud_to_speed(int baud) {
	switch (baud) {
		case 9600:   return B9600;
		case 19200:  return B19200;
		case 38400:  return B38400;
		case 57600:  return B57600;
		case 115200: return B115200;
		case 230400: return B230400;
		default:     return B0;
	}
}

} // namespace

SerialPort_C::SerialPort_C(std::string device_path, int baud, std::string eol)
	: device_path_(std::move(device_path)), baud_(baud), eol_(std::move(eol)) {
}

SerialPort_C::~SerialPort_C() {
	close();
}

bool SerialPort_C::open() {
	if (fd_ >= 0) return true;

	const speed_t speed = baud_to_speed(baud_);
	if (speed == B0) {
		LOG_ERR("serial: unsupported baud " << baud_);
		return false;
	}

	fd_ = ::open(device_path_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
	if (fd_ < 0) {
		LOG_ERR("serial: open " << device_path_ << " failed: " << std::strerror(errno));
		return false;
	}

	termios tio{};
	if (::tcgetattr(fd_, &tio) != 0) {
		LOG_ERR("serial: tcgetattr failed: " << std::strerror(errno));
		close();
		return false;
	}
	::cfmakeraw(&tio);
	tio.c_cflag |= (CLOCAL | CREAD);
	tio.c_cflag &= ~CSTOPB;  // 1 stop bit
	tio.c_cflag &= ~PARENB;  // no parity
	tio.c_cflag &= ~CSIZE;
	tio.c_cflag |= CS8;
	tio.c_cc[VMIN] = 0;
	tio.c_cc[VTIME] = 0;
	::cfsetispeed(&tio, speed);
	::cfsetospeed(&tio, speed);
	if (::tcsetattr(fd_, TCSANOW, &tio) != 0) {
		LOG_ERR("serial: tcsetattr failed: " << std::strerror(errno));
		close();
		return false;
	}
	::tcflush(fd_, TCIOFLUSH);
	rx_buffer_.clear();
	LOG_ALWAYS("serial: opened " << device_path_ << " @ " << baud_);
	return true;
}

bool SerialPort_C::write_line(const std::string& line) {
	if (fd_ < 0) return false;
	const std::string out = line + eol_;
	std::size_t written = 0;
	while (written < out.size()) {
		const ssize_t n = ::write(fd_, out.data() + written, out.size() - written);
		if (n > 0) {
			written += static_cast<std::size_t>(n);
			continue;
		}
		if (n < 0 && errno == EINTR) continue;
		if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
			pollfd pfd{fd_, POLLOUT, 0};
			if (::poll(&pfd, 1, 50) <= 0) {
				LOG_ERR("serial: write stalled on " << device_path_);
				return false;
			}
			continue;
		}
		LOG_ERR("serial: write failed: " << std::strerror(errno));
		return false;
	}
	return true;
}

std::optional<std::string> SerialPort_C::pop_line() {
	while (true) {
		const auto pos = rx_buffer_.find_first_of("\r\n");
		if (pos == std::string::npos) return std::nullopt;
		std::string line = rx_buffer_.substr(0, pos);
		rx_buffer_.erase(0, pos + 1);
		if (!line.empty()) return line; // skip blank lines from \r\n pairs
	}
}

std::optional<std::string> SerialPort_C::read_line(std::chrono::milliseconds timeout) {
	if (fd_ < 0) return std::nullopt;
	if (auto ready = pop_line()) return ready;

	const auto deadline = std::chrono::steady_clock::now() + timeout;
	char buf[256];
	while (true) {
		const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
			deadline - std::chrono::steady_clock::now());
		if (remaining.count() <= 0) return std::nullopt;

		pollfd pfd{fd_, POLLIN, 0};
		const int pr = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
		if (pr < 0 && errno == EINTR) continue;
		if (pr <= 0) return std::nullopt;

		const ssize_t n = ::read(fd_, buf, sizeof(buf));
		if (n < 0) {
			if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
			LOG_ERR("serial: read failed: " << std::strerror(errno));
			return std::nullopt;
		}
		rx_buffer_.append(buf, static_cast<std::size_t>(n));
		if (auto line = pop_line()) return line;
	}
}

void SerialPort_C::discard_input() {
	if (fd_ < 0) return;
	::tcflush(fd_, TCIFLUSH);
	rx_buffer_.clear();
}

void SerialPort_C::close() noexcept {
	if (fd_ < 0) return;
	::close(fd_);
	fd_ = -1;
	rx_buffer_.clear();
}
