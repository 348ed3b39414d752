#pragma once
#include <cstdint>

namespace ocast {

constexpr uint16_t DEFAULT_PORT = 8009;

constexpr int FRAME_LENGTH_SIZE = 4;
constexpr int MAX_MESSAGE_SIZE = 65536;

constexpr char SENDER_ID[] = "sender-0";
constexpr char RECEIVER_ID[] = "receiver-0";

constexpr char DEFAULT_MEDIA_RECEIVER_APP_ID[] = "CC1AD845";
constexpr char BACKDROP_APP_ID[] = "E8C28D3C";

// supportedMediaCommands bit flags
constexpr int MEDIA_COMMAND_PAUSE = 1;
constexpr int MEDIA_COMMAND_SEEK = 2;

} // namespace ocast
