#include <sys/ioctl.h>
#include <unistd.h>
#include <cstdio>
#include <cstring>
#include <vector>
#include "copyright.h"
#include "error_format.h"

namespace conformix {
namespace errors {

//-------------------------------------------------------------------------------------------------
ConformixError::ConformixError(const std::string &message, const ErrorKind kind_in) :
    std::runtime_error(message), kind{kind_in}
{}

//-------------------------------------------------------------------------------------------------
ErrorKind ConformixError::getKind() const {
  return kind;
}

//-------------------------------------------------------------------------------------------------
std::string terminalFormat(const std::string &message, const char* class_caller,
                           const char* method_caller, const int implicit_indent,
                           const int first_indent, const int subsq_indent, const int width_in,
                           const RTMessageKind style) {

  // Form the starting string.  Warnings and alerts carry their own prefix in the class name.
  const bool has_class  = (class_caller != nullptr && strlen(class_caller) > 0);
  const bool has_method = (method_caller != nullptr && strlen(method_caller) > 0);
  std::string msg;
  if (has_class && has_method) {
    msg = std::string(class_caller) + " :: (" + std::string(method_caller) + ") ";
  }
  else if (has_class) {
    msg = std::string(class_caller) + " :: ";
  }
  else if (has_method) {
    msg = std::string(method_caller) + " :: ";
  }
  msg += message;

  // Obtain the console size.  If the output is not a terminal, the call fails and a standard
  // width is assumed.
  struct winsize console_dims;
  const int ioctl_status = ioctl(STDOUT_FILENO, TIOCGWINSZ, &console_dims);
  const int width = (width_in > 0) ? width_in :
                    (ioctl_status == 0 && console_dims.ws_col > 2) ? console_dims.ws_col - 1 : 80;

  // Break the message into words, each with the white space that follows it.  Carriage returns
  // are words of their own.
  const int msize = msg.size();
  std::vector<std::string> words;
  std::vector<int> white_space;
  if (msize > 0 && msg[0] == ' ') {
    words.push_back(std::string(""));
  }
  int pos = 0;
  while (pos < msize) {
    const int word_start = pos;
    while (pos < msize && msg[pos] != ' ' && msg[pos] != '\n') {
      pos++;
    }
    if (pos > word_start) {
      words.push_back(msg.substr(word_start, pos - word_start));
    }
    if (pos < msize && msg[pos] == '\n') {
      if (pos > word_start) {
        white_space.push_back(0);
      }
      words.push_back("\n");
      pos++;
    }
    const int space_start = pos;
    while (pos < msize && msg[pos] == ' ') {
      pos++;
    }
    white_space.push_back(pos - space_start);
  }

  // The std::runtime_error printout on Linux begins with "  what():  ", eleven characters of
  // implicit indentation which the first line must account for.
  std::string parsed_msg;
  switch (style) {
  case RTMessageKind::ERROR:
    parsed_msg.append(first_indent, ' ');
    break;
  case RTMessageKind::TABULAR:
    break;
  }
  const std::string subsq_spacer(subsq_indent, ' ');
  const int word_count = words.size();
  int nchar = implicit_indent + first_indent;
  bool line_is_fresh = true;
  for (int i = 0; i < word_count; i++) {
    const int word_length = words[i].size();
    if (line_is_fresh || nchar + word_length < width) {
      parsed_msg += words[i];
      if (words[i] == "\n") {
        parsed_msg += subsq_spacer;
        nchar = subsq_indent;
        line_is_fresh = true;
      }
      else {
        nchar += word_length;
        line_is_fresh = false;
      }
    }
    if (i + 1 < word_count) {
      if (nchar + white_space[i] + static_cast<int>(words[i + 1].size()) < width) {
        parsed_msg.append(white_space[i], ' ');
        nchar += white_space[i];
      }
      else {
        parsed_msg += "\n" + subsq_spacer;
        nchar = subsq_indent;
        line_is_fresh = true;
      }
    }
  }

  // Pad the result with white space if there was a preset width
  if (width_in > 0 && nchar < width) {
    parsed_msg.append(width - nchar, ' ');
  }
  return parsed_msg;
}

//-------------------------------------------------------------------------------------------------
void rtErr(const std::string &message, const char* class_caller, const char* method_caller) {
  rtErr(ErrorKind::GENERAL, message, class_caller, method_caller);
}

//-------------------------------------------------------------------------------------------------
void rtErr(const ErrorKind kind, const std::string &message, const char* class_caller,
           const char* method_caller) {
  const std::string parsed_msg = terminalFormat(message, class_caller, method_caller, 11, 0, 11);
  throw ConformixError(parsed_msg, kind);
}

//-------------------------------------------------------------------------------------------------
void rtWarn(const std::string &message, const char* class_caller, const char* method_caller) {
  std::string ccall(" Warning: ");
  if (class_caller != nullptr) {
    ccall += std::string(class_caller);
  }
  const std::string parsed_msg = terminalFormat(message, ccall.c_str(), method_caller, 0, 0, 10);
  printf("%s\n", parsed_msg.c_str());
}

//-------------------------------------------------------------------------------------------------
std::string listSeparator(const int current_item, const int item_count) {
  if (item_count > 2) {
    return (current_item < item_count - 2) ? ", " : ", and ";
  }
  else if (item_count == 2 && current_item == 0) {
    return " and ";
  }
  return "";
}

//-------------------------------------------------------------------------------------------------
std::string getEnumerationName(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::GENERAL:
    return std::string("GENERAL");
  case ErrorKind::SHAPE_MISMATCH:
    return std::string("SHAPE_MISMATCH");
  case ErrorKind::DIMENSION_MISMATCH:
    return std::string("DIMENSION_MISMATCH");
  case ErrorKind::DEGENERATE_WEIGHTS:
    return std::string("DEGENERATE_WEIGHTS");
  case ErrorKind::TYPE_MISMATCH:
    return std::string("TYPE_MISMATCH");
  }
  __builtin_unreachable();
}

} // namespace errors
} // namespace conformix
