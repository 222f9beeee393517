#ifndef PROCSCOPE_HPP
#define PROCSCOPE_HPP

// Main header that includes everything

#include <procscope/channel.hpp>
#include <procscope/conversation.hpp>
#include <procscope/errors.hpp>
#include <procscope/process_handle.hpp>
#include <procscope/types.hpp>
#include <procscope/version.hpp>

#endif // PROCSCOPE_HPP
