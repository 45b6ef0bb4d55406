#pragma once
#include <chrono>
#include <iostream>
#include <string>

namespace lanscout {

class HandlerRegistry;
class Scanner;

// Install ssh, http, https, home-assistant and matter handlers. Output goes to out.
void register_builtin_handlers(HandlerRegistry& registry, std::ostream& out = std::cout);
void register_builtin_handlers(Scanner& scanner, std::ostream& out = std::cout);

/**
 * @brief One-shot HTTP/1.1 GET.
 * @return "<status> <content-type>" on the first line followed by up to max_body bytes of body.
 * Throws std::runtime_error on resolve, connect, write or read failure (including timeout).
 */
std::string http_get_summary(const std::string& host, unsigned short port, const std::string& target,
                             std::chrono::seconds timeout = std::chrono::seconds(5),
                             std::size_t max_body = 1000);

} // namespace lanscout
