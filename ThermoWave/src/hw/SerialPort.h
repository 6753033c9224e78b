/*
==============================================================================
	File: SerialPort.h
	Desc: Line-oriented byte link used by the TCS driver.
	ISerialLink_S is the seam: SerialPort_C talks to a POSIX tty (termios,
	raw 8N1, poll()-based read timeouts); unit tests plug in a scripted link.
	Methods return false / nullopt on soft failure, the driver decides
	whether that is fatal.
==============================================================================
*/

#pragma once
#include <string>
#include <optional>
#include <chrono>

struct ISerialLink_S {
	virtual ~ISerialLink_S() = default;
	virtual bool open() = 0;
	virtual bool is_open() const = 0;
	virtual bool write_line(const std::string& line) = 0; // terminator appended by the link
	virtual std::optional<std::string> read_line(std::chrono::milliseconds timeout) = 0; // nullopt on timeout / error
	virtual void discard_input() = 0; // drop stale unread bytes before a query
	virtual void close() noexcept = 0;
}; // ISerialLink_S

class SerialPort_C : public ISerialLink_S {
public:
	SerialPort_C(std::string device_path, int baud, std::string eol = "\r");
	~SerialPort_C() override;
	// owns a file descriptor: no copies
	SerialPort_C(const SerialPort_C&) = delete;
	SerialPort_C& operator=(const SerialPort_C&) = delete;

	bool open() override;
	bool is_open() const override { return fd_ >= 0; }
	bool write_line(const std::string& line) override;
	std::optional<std::string> read_line(std::chrono::milliseconds timeout) override;
	void discard_input() override;
	void close() noexcept override;

	const std::string& device_path() const { return device_path_; }

private:
	std::string device_path_;
	int baud_;
	std::string eol_;
	int fd_ = -1;
	std::string rx_buffer_; // bytes read past the last returned line

	std::optional<std::string> pop_line(); // complete line from rx_buffer_, if any
}; // SerialPort_C
