// Repository: avpipe
// Component: MediaError
// Purpose: Error taxonomy shared by every pipeline stage, and the mapping
//          from FFmpeg return codes into it.
// Copyright (c) 2025 RetroVue

#ifndef AVPIPE_UTIL_MEDIA_ERROR_HPP_
#define AVPIPE_UTIL_MEDIA_ERROR_HPP_

#include <string>

namespace avpipe::util {

// Result of every fallible avpipe operation.
//
// kDecodeError is per-packet and non-fatal: the decoder keeps accepting
// packets. kEncodeError, kOutOfMemory and kInitializationFailed are fatal to
// the pipeline instance that returned them. kEndOfStream is not a failure;
// pull APIs return it once a finite sequence is exhausted.
enum class MediaError {
  kOk = 0,
  kInitializationFailed,
  kUnsupportedCodec,
  kInvalidSettings,
  kInvalidTimeBase,
  kInvalidBuffer,
  kOutOfMemory,
  kUnsupportedConversion,
  kDecodeError,
  kEncodeError,
  kPipelineClosed,
  kEndOfStream,
};

// Where a native return code was produced. The same native code can mean
// different things in different places (EINVAL while opening an encoder is
// a settings problem; EINVAL while decoding is a bad packet).
enum class NativeContext {
  kDecoderOpen,
  kEncoderOpen,
  kDecode,
  kEncode,
  kConvert,
  kBuffer,
  kContainerOpen,
  kContainerWrite,
  kContainerSeek,
};

const char* MediaErrorName(MediaError error);

inline bool IsOk(MediaError error) { return error == MediaError::kOk; }

// Fatal errors close the pipeline instance that produced them.
bool IsFatal(MediaError error);

// Maps a negative FFmpeg return code to exactly one taxonomy entry for the
// given context. Non-negative codes map to kOk.
MediaError MapNativeError(int native_code, NativeContext context);

inline MediaError MapDecodeError(int native_code) {
  return MapNativeError(native_code, NativeContext::kDecode);
}
inline MediaError MapEncodeError(int native_code) {
  return MapNativeError(native_code, NativeContext::kEncode);
}
// Codec context setup on either side.
inline MediaError MapInitError(int native_code, bool encoder) {
  return MapNativeError(native_code,
                        encoder ? NativeContext::kEncoderOpen : NativeContext::kDecoderOpen);
}

// av_strerror() wrapped into a std::string.
std::string NativeErrorString(int native_code);

}  // namespace avpipe::util

#endif  // AVPIPE_UTIL_MEDIA_ERROR_HPP_
