#ifndef AMT_CARET_HPP
#define AMT_CARET_HPP

#include "caret/basic.hpp"
#include "caret/consumers/base.hpp"
#include "caret/consumers/error_tracking.hpp"
#include "caret/consumers/stream.hpp"
#include "caret/core/term/terminal.hpp"
#include "caret/document.hpp"
#include "caret/emitter.hpp"
#include "caret/files.hpp"
#include "caret/render_config.hpp"
#include "caret/renderer.hpp"
#include "caret/span.hpp"

#endif // AMT_CARET_HPP
