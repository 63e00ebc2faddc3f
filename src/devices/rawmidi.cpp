// ==============================================================================
// rawmidi.cpp - Приём MIDI через ALSA rawmidi (/dev/snd/midiC*D*)
// ==============================================================================
//
// Устройство открывается неблокирующим; поток чтения ждёт в poll() на двух
// дескрипторах: устройство и self-pipe для остановки. Байты декодируются
// midi::Decoder и помещаются в очередь в порядке поступления.
//
// POLLHUP/POLLERR означают, что устройство отключено: очередь закрывается,
// и движок завершает цикл после обработки оставшихся сообщений.
//
// ==============================================================================

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <midimacro/devices.hpp>
#include <midimacro/match.hpp>
#include <midimacro/midi.hpp>
#include <midimacro/output.hpp>
#include <midimacro/platform.hpp>
#include <poll.h>
#include <system_error>
#include <unistd.h>

namespace midimacro::devices {

namespace {

constexpr std::string_view RAWMIDI_PREFIX = "midiC";

/// Имя карты из /proc/asound/card<N>/id ("card<N>" если файл недоступен)
std::string card_id(const std::filesystem::path& proc_dir, int card) {
    std::ifstream in(proc_dir / ("card" + std::to_string(card)) / "id");
    std::string id;
    if (in && std::getline(in, id)) {
        while (!id.empty() && (id.back() == '\n' || id.back() == '\r' || id.back() == ' ')) {
            id.pop_back();
        }
        if (!id.empty()) {
            return id;
        }
    }
    return "card" + std::to_string(card);
}

bool parse_decimal(std::string_view s, int& out) {
    if (s.empty() || s.size() > 4) {
        return false;
    }
    int value = 0;
    for (char c : s) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

}  // namespace

std::optional<std::pair<int, int>> parse_rawmidi_name(std::string_view filename) {
    if (filename.substr(0, RAWMIDI_PREFIX.size()) != RAWMIDI_PREFIX) {
        return std::nullopt;
    }
    std::string_view rest = filename.substr(RAWMIDI_PREFIX.size());
    auto d = rest.find('D');
    if (d == std::string_view::npos) {
        return std::nullopt;
    }
    int card = 0;
    int device = 0;
    if (!parse_decimal(rest.substr(0, d), card) || !parse_decimal(rest.substr(d + 1), device)) {
        return std::nullopt;
    }
    return std::make_pair(card, device);
}

// ----------------------------------------------------------------------------
// RawMidiAdapter
// ----------------------------------------------------------------------------

RawMidiAdapter::RawMidiAdapter(output::Writer& writer, std::filesystem::path dev_dir,
                               std::filesystem::path proc_dir)
    : writer_(writer), dev_dir_(std::move(dev_dir)), proc_dir_(std::move(proc_dir)) {}

RawMidiAdapter::~RawMidiAdapter() {
    stop_listening();
}

std::vector<MidiPort> RawMidiAdapter::list_ports() {
    std::vector<MidiPort> ports;

    std::error_code ec;
    std::filesystem::directory_iterator it(dev_dir_, ec);
    if (ec) {
        writer_.debug("cannot read " + platform::path_to_utf8(dev_dir_) + ": " + ec.message());
        return ports;
    }

    for (const auto& entry : it) {
        auto parsed = parse_rawmidi_name(platform::path_to_utf8(entry.path().filename()));
        if (!parsed) {
            continue;
        }
        MidiPort port;
        port.card = parsed->first;
        port.device_index = parsed->second;
        port.device = entry.path();
        port.name = card_id(proc_dir_, port.card) + " (hw:" + std::to_string(port.card) + "," +
                    std::to_string(port.device_index) + ")";
        ports.push_back(std::move(port));
    }

    std::sort(ports.begin(), ports.end(), [](const MidiPort& a, const MidiPort& b) {
        return std::make_pair(a.card, a.device_index) < std::make_pair(b.card, b.device_index);
    });
    return ports;
}

ListenResult RawMidiAdapter::start_listening(std::string_view port_pattern,
                                             engine::MessageQueue& queue) {
    ListenResult result;

    if (listening_.load()) {
        result.error = "already listening";
        return result;
    }

    auto ports = list_ports();
    auto found = std::find_if(ports.begin(), ports.end(), [&](const MidiPort& p) {
        return match::icontains(p.name, port_pattern);
    });
    if (found == ports.end()) {
        result.error = "no MIDI port matching '" + std::string(port_pattern) + "'";
        return result;
    }

    int fd = ::open(found->device.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        result.error = "cannot open " + platform::path_to_utf8(found->device) + ": " +
                       std::strerror(errno);
        return result;
    }

    if (pipe2(wake_pipe_, O_CLOEXEC | O_NONBLOCK) != 0) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        ::close(fd);
        return result;
    }

    device_fd_ = fd;
    listening_.store(true);
    thread_ = std::thread(&RawMidiAdapter::read_loop, this, fd, &queue);

    writer_.debug("listening on " + found->name + " (" + platform::path_to_utf8(found->device) +
                  ")");

    result.ok = true;
    result.port = *found;
    return result;
}

void RawMidiAdapter::stop_listening() {
    if (!thread_.joinable()) {
        return;
    }

    listening_.store(false);
    const char wake = 1;
    if (::write(wake_pipe_[1], &wake, 1) < 0 && errno != EAGAIN) {
        writer_.debug(std::string("wake pipe write failed: ") + std::strerror(errno));
    }
    thread_.join();

    close_fd(device_fd_);
    close_fd(wake_pipe_[0]);
    close_fd(wake_pipe_[1]);
}

void RawMidiAdapter::read_loop(int fd, engine::MessageQueue* queue) {
    midi::Decoder decoder;
    std::vector<midi::MidiMessage> messages;
    std::uint8_t buffer[256];

    pollfd fds[2] = {{fd, POLLIN, 0}, {wake_pipe_[0], POLLIN, 0}};

    while (listening_.load()) {
        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            writer_.error(std::string("poll failed: ") + std::strerror(errno));
            break;
        }

        if (fds[1].revents != 0) {
            break;
        }

        if (fds[0].revents & POLLIN) {
            ssize_t n = ::read(fd, buffer, sizeof(buffer));
            if (n < 0) {
                if (errno == EAGAIN || errno == EINTR) {
                    continue;
                }
                writer_.error(std::string("MIDI read failed: ") + std::strerror(errno));
                break;
            }
            if (n == 0) {
                writer_.warn("MIDI device closed");
                break;
            }

            messages.clear();
            decoder.feed(buffer, static_cast<std::size_t>(n), messages);
            for (const auto& msg : messages) {
                queue->push(msg);
            }
            continue;
        }

        if (fds[0].revents & (POLLHUP | POLLERR | POLLNVAL)) {
            writer_.warn("MIDI device disconnected");
            break;
        }
    }

    listening_.store(false);
    queue->close();
}

std::unique_ptr<MidiAdapter> make_midi_adapter(output::Writer& writer) {
    std::error_code ec;
    if (!std::filesystem::is_directory("/dev/snd", ec)) {
        return nullptr;
    }
    return std::make_unique<RawMidiAdapter>(writer);
}

}  // namespace midimacro::devices
