/*------------------------------------------------------------------------------
 *
 *  This file is part of avecado
 *
 *  Author: matt.amos@mapquest.com
 *
 *  Copyright 2010-1 Mapquest, Inc.  All Rights reserved.
 *
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or (at your option) any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin St, Fifth Floor, Boston, MA  02110-1301  USA
 *
 *-----------------------------------------------------------------------------*/
#include "common.hpp"
#include "logging/logger.hpp"
#include <boost/filesystem.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <exception>
#include <stdexcept>
#include <iomanip>
#include <iostream>
#include <algorithm>

using boost::function;
using std::runtime_error;
using std::exception;
using std::cout;
using std::cerr;
using std::endl;
using std::setw;
using std::flush;
using std::string;
using std::vector;
namespace fs = boost::filesystem;

#define TEST_NAME_WIDTH (45)

namespace {

void unwind_nested_exception(std::ostream &out, const std::exception &e) {
  out << e.what();
  try {
    std::rethrow_if_nested(e);

  } catch (const std::exception &nested) {
    out << ". Caused by: ";
    unwind_nested_exception(out, nested);

  } catch (...) {
    out << ". Caused by UNKNOWN EXCEPTION";
  }
}

} // anonymous namespace

namespace test {

int run(const string &name, function<void ()> test) {
  cout << setw(TEST_NAME_WIDTH) << name << flush;
  try {
    test();
    cout << "  [PASS]" << endl;
    return 0;

  } catch (const exception &ex) {
    cout << "  [FAIL: ";
    unwind_nested_exception(cout, ex);
    cout << "]" << endl;
    return 1;

  } catch (...) {
    cerr << "  [FAIL: Unexpected error]" << endl;
    throw;
  }
}

void assert_near(double actual, double expected, double tolerance, string message) {
  if (!(std::abs(actual - expected) <= tolerance)) {
    throw runtime_error((boost::format("%1%: expected=%2% (+/- %3%), actual=%4%.")
                         % message % expected % tolerance % actual).str());
  }
}

void assert_equal_tiles(const vector<pyramid::tile_index> &actual,
                        const vector<pyramid::tile_index> &expected,
                        string message) {
  const size_t n = std::min(actual.size(), expected.size());
  for (size_t i = 0; i < n; ++i) {
    if (actual[i] != expected[i]) {
      throw runtime_error((boost::format("%1%: at position %2%, expected=%3%, actual=%4%.")
                           % message % i % expected[i] % actual[i]).str());
    }
  }
  assert_equal<size_t>(actual.size(), expected.size(), message + ": number of tiles");
}

void assert_equal_results(const pyramid::pyramid_result &actual,
                          const pyramid::pyramid_result &expected,
                          string message) {
  assert_equal<size_t>(actual.size(), expected.size(), message + ": number of zoom levels");

  auto a_itr = actual.begin();
  auto e_itr = expected.begin();
  for (; e_itr != expected.end(); ++a_itr, ++e_itr) {
    assert_equal<int>(a_itr->first, e_itr->first, message + ": zoom level");
    assert_equal_tiles(a_itr->second, e_itr->second,
                       (boost::format("%1%: z%2%") % message % e_itr->first).str());
  }
}

json::json() : m_type(json::type_NONE) {}
json::json(const json &j) : m_type(j.m_type), m_buf(j.m_buf.str()) {}

std::string json::str() const {
  std::ostringstream out;
  out << *this;
  return out.str();
}

std::ostream &operator<<(std::ostream &out, const json &j) {
   if (j.m_type == json::type_NONE) {
      out << "null";

   } else {
      out << j.m_buf.str();
      if (j.m_type == json::type_DICT) {
         out << "}";
      } else {
         out << "]";
      }
   }
   return out;
}

void json::quote(const json &j) { m_buf << j; }
void json::quote(const std::string &s) { m_buf << "\"" << s << "\""; }
void json::quote(const char *s) { m_buf << "\"" << s << "\""; }
void json::quote(int i) { m_buf << i; }
void json::quote(double d) { m_buf << d; }

temp_dir::temp_dir()
   : m_path(fs::temp_directory_path() / fs::unique_path("pyramid-test-%%%%-%%%%-%%%%-%%%%")) {
   fs::create_directories(m_path);
}

temp_dir::~temp_dir() {
   boost::system::error_code err;

   // catch all errors - we don't want to throw in the destructor
   try {
      // but loop while the path exists and the errors are
      // ignorable.
      while (fs::exists(m_path)) {
         fs::remove_all(m_path, err);

         // for any non-ignorable error, there's not much we can
         // do from the destructor except complain loudly.
         if (err && (err != boost::system::errc::no_such_file_or_directory)) {
            LOG_WARNING(boost::format("Unable to remove temporary "
                                      "directory %1%: %2%")
                        % m_path % err.message());
            break;
         }
      }

   } catch (const std::exception &e) {
      LOG_ERROR(boost::format("Exception caught while trying to remove "
                              "temporary directory %1%: %2%")
                % m_path % e.what());

   } catch (...) {
      LOG_ERROR(boost::format("Unknown exception caught while trying to "
                              "remove temporary directory %1%")
                % m_path);
   }
}

} // namespace test
