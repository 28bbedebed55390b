// Repository: avpipe
// Component: MediaError
// Purpose: Error taxonomy shared by every pipeline stage, and the mapping
//          from FFmpeg return codes into it.
// Copyright (c) 2025 RetroVue

#include "avpipe/util/MediaError.hpp"

#include <cerrno>

extern "C" {
#include <libavutil/error.h>
}

namespace avpipe::util {

const char* MediaErrorName(MediaError error) {
  switch (error) {
    case MediaError::kOk: return "Ok";
    case MediaError::kInitializationFailed: return "InitializationFailed";
    case MediaError::kUnsupportedCodec: return "UnsupportedCodec";
    case MediaError::kInvalidSettings: return "InvalidSettings";
    case MediaError::kInvalidTimeBase: return "InvalidTimeBase";
    case MediaError::kInvalidBuffer: return "InvalidBuffer";
    case MediaError::kOutOfMemory: return "OutOfMemory";
    case MediaError::kUnsupportedConversion: return "UnsupportedConversion";
    case MediaError::kDecodeError: return "DecodeError";
    case MediaError::kEncodeError: return "EncodeError";
    case MediaError::kPipelineClosed: return "PipelineClosed";
    case MediaError::kEndOfStream: return "EndOfStream";
  }
  return "Unknown";
}

bool IsFatal(MediaError error) {
  switch (error) {
    case MediaError::kInitializationFailed:
    case MediaError::kOutOfMemory:
    case MediaError::kEncodeError:
      return true;
    default:
      return false;
  }
}

MediaError MapNativeError(int native_code, NativeContext context) {
  if (native_code >= 0) return MediaError::kOk;
  if (native_code == AVERROR(ENOMEM)) return MediaError::kOutOfMemory;

  switch (context) {
    case NativeContext::kDecoderOpen:
      if (native_code == AVERROR_DECODER_NOT_FOUND) return MediaError::kUnsupportedCodec;
      return MediaError::kInitializationFailed;

    case NativeContext::kEncoderOpen:
      if (native_code == AVERROR_ENCODER_NOT_FOUND) return MediaError::kUnsupportedCodec;
      if (native_code == AVERROR(EINVAL) || native_code == AVERROR(ERANGE)) {
        return MediaError::kInvalidSettings;
      }
      return MediaError::kInitializationFailed;

    case NativeContext::kDecode:
      return MediaError::kDecodeError;

    case NativeContext::kEncode:
      return MediaError::kEncodeError;

    case NativeContext::kConvert:
      if (native_code == AVERROR(EINVAL) || native_code == AVERROR(ENOSYS) ||
          native_code == AVERROR_PATCHWELCOME) {
        return MediaError::kUnsupportedConversion;
      }
      return MediaError::kInvalidBuffer;

    case NativeContext::kBuffer:
      return MediaError::kInvalidBuffer;

    case NativeContext::kContainerOpen:
      return MediaError::kInitializationFailed;

    case NativeContext::kContainerWrite:
      return MediaError::kEncodeError;

    // A failed seek leaves the reader where it was; not fatal.
    case NativeContext::kContainerSeek:
      return MediaError::kDecodeError;
  }
  return MediaError::kInitializationFailed;
}

std::string NativeErrorString(int native_code) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(native_code, errbuf, sizeof(errbuf));
  return std::string(errbuf);
}

}  // namespace avpipe::util
