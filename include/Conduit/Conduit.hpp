#pragma once
#include <Conduit/Async/Cancellation.hpp>
#include <Conduit/Async/Generator.hpp>
#include <Conduit/Defines.hpp>
#include <Conduit/Exceptions/Exception.hpp>
#include <Conduit/Exceptions/StreamException.hpp>
#include <Conduit/IO/BufferedStream.hpp>
#include <Conduit/IO/EncodingNormalizer.hpp>
#include <Conduit/IO/FileResource.hpp>
#include <Conduit/IO/IStreamResource.hpp>
#include <Conduit/IO/MemoryResource.hpp>
#include <Conduit/IO/PushBackBuffer.hpp>
#include <Conduit/IO/RetryPolicy.hpp>
#include <Conduit/IO/SeekOrigin.hpp>
#include <Conduit/IO/StreamError.hpp>
#include <Conduit/IO/StreamOptions.hpp>
#include <Conduit/IO/TextEncoding.hpp>
#include <Conduit/Log/ConsoleSink.hpp>
#include <Conduit/Log/Logger.hpp>
#include <Conduit/Primitives.hpp>
#include <Conduit/Time/MonotonicClock.hpp>
#include <Conduit/Time/Sleep.hpp>
#include <Conduit/Time/TimePoint.hpp>
#include <Conduit/Units.hpp>
