#pragma once

namespace ocast {
namespace Namespace {

constexpr char Connection[] = "urn:x-cast:com.google.cast.tp.connection";
constexpr char Heartbeat[] = "urn:x-cast:com.google.cast.tp.heartbeat";
constexpr char Receiver[] = "urn:x-cast:com.google.cast.receiver";
constexpr char Media[] = "urn:x-cast:com.google.cast.media";

} // namespace Namespace

namespace MessageType {

// connection
constexpr char Connect[] = "CONNECT";
constexpr char Close[] = "CLOSE";

// heartbeat
constexpr char Ping[] = "PING";
constexpr char Pong[] = "PONG";

// receiver
constexpr char GetStatus[] = "GET_STATUS";
constexpr char Launch[] = "LAUNCH";
constexpr char Stop[] = "STOP";
constexpr char SetVolume[] = "SET_VOLUME";
constexpr char ReceiverStatus[] = "RECEIVER_STATUS";
constexpr char LaunchError[] = "LAUNCH_ERROR";

// media
constexpr char Load[] = "LOAD";
constexpr char Seek[] = "SEEK";
constexpr char MediaStatus[] = "MEDIA_STATUS";
constexpr char LoadFailed[] = "LOAD_FAILED";
constexpr char LoadCancelled[] = "LOAD_CANCELLED";
constexpr char InvalidRequest[] = "INVALID_REQUEST";

} // namespace MessageType
} // namespace ocast
