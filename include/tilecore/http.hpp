/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of tilecore.
 *
 * Copyright (C) 2024-2026 by the tilecore developer community.
 * For a full list of authors see the git log.
 */

#ifndef HTTP_HPP
#define HTTP_HPP

#include <string>
#include <utility>
#include <vector>
#include <exception>

/**
 * Contains the HTTP-adjacent pieces of the tile core: the errors which end a
 * single tile request and the query string helpers. The server framework
 * itself lives elsewhere.
 */
namespace http {

  using headers_t = std::vector<std::pair<std::string, std::string> >;


/**
 * Base class for HTTP protocol related exceptions.
 *
 * Not directly constructable - use the derived classes instead.
 */
class exception : public std::exception {
private:
  /// numerical status code, for more information see
  /// http://en.wikipedia.org/wiki/List_of_HTTP_status_codes
  const int code_;

  /// specific error message, meant entirely for humans to read.
  const std::string message_;

protected:
  exception(int c, std::string m);

public:
  ~exception() noexcept override = default;

  int code() const;
  const char* what() const noexcept override;
};

/**
 * An error which has caused the current request to fail which is
 * due to an internal error or code bug. The client might try again,
 * but there is no guarantee it will work. Use only for conditions
 * which are unrecoverable.
 */
class server_error : public exception {
public:
  explicit server_error(const std::string &message);
};

/**
 * The client's request is badly-formed and cannot be serviced. Used
 * mainly for parse errors, or invalid data.
 */
class bad_request : public exception {
public:
  explicit bad_request(const std::string &message);
};

/**
 * Content negotiation failed to find an encoding which the server is able
 * to produce for this payload and which the client is prepared to accept.
 */
class not_acceptable : public exception {
public:
  explicit not_acceptable(const std::string &message);
};

/**
 * A tile source returned a raster payload wrapped in a transfer
 * compression. Raster formats are compressed internally, so the pairing
 * points at a broken source and the tile cannot be served as-is.
 */
class incompatible_encoding : public exception {
public:
  incompatible_encoding(const std::string &format, const std::string &encoding);
};

/**
 * A Content-Type was requested for a payload whose format could not be
 * determined.
 */
class unknown_format : public exception {
public:
  explicit unknown_format(const std::string &message);
};

/**
 * Decodes a url-encoded string.
 */
std::string urldecode(const std::string &s);

/**
 * Parses a query string into an array of key-value pairs.
 *
 * Duplicate keys are kept, in the order they appear. Tile function sources
 * receive repeated keys as JSON arrays, so the order matters.
 *
 * Keys and values are returned as they appear in the query string, i.e.
 * still url-encoded.
 */
std::vector<std::pair<std::string, std::string> > parse_params(const std::string &p);

} // namespace http

#endif /* HTTP_HPP */
