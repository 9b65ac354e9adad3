#include "fmx_text_normalizer.h"
#include <utf8cpp/utf8.h>
#include <cctype>

namespace fmx::extract {

namespace {

  bool is_fill_char(char c)
  {
    return c == '_' || c == '.';
  }

  // bytes of multi-byte UTF-8 sequences count as letters
  bool is_word_char(char c)
  {
    unsigned char u = static_cast<unsigned char>(c);
    return u >= 0x80 || std::isalnum(u);
  }

  fmx_string replace_fill_runs(const fmx_string& text, size_t min_run)
  {
    fmx_string result;
    size_t i = 0;
    while (i < text.size())
    {
      if (!is_fill_char(text[i]))
      {
        result += text[i++];
        continue;
      }
      size_t end = i;
      while (end < text.size() && is_fill_char(text[end])) ++end;
      if (end - i >= min_run)
      {
        result += ' ';
      }
      else
      {
        result += text.substr(i, end - i);
      }
      i = end;
    }
    return result;
  }

  bool is_all_caps_word(const fmx_string& word)
  {
    int letters = 0;
    for (size_t i = 0; i < word.size(); ++i)
    {
      unsigned char c = static_cast<unsigned char>(word[i]);
      if (c < 0x80 && std::isalpha(c))
      {
        if (std::islower(c)) return false;
        ++letters;
      }
    }
    return letters >= 2;
  }

}

fmx_string clean_key(const fmx_string& text, bool title_case)
{
  fmx_string key = replace_fill_runs(text, 3).normalize_whitespace();

  size_t end = key.size();
  while (end > 0 && (key[end - 1] == ':' || std::isspace(static_cast<unsigned char>(key[end - 1]))))
  {
    --end;
  }
  key = key.substr(0, end);

  if (!title_case)
  {
    return key;
  }

  std::vector<fmx_string> words = key.words();
  for (auto& word : words)
  {
    if (!is_all_caps_word(word))
    {
      word = word.title_case();
    }
  }
  return fmx_string(" ").join(words);
}

fmx_string clean_value(const fmx_string& text)
{
  fmx_string stripped;
  for (size_t i = 0; i < text.size(); ++i)
  {
    char c = text[i];
    if (c == '(' || c == ')' || c == '[' || c == ']' || c == '|')
    {
      continue;
    }
    stripped += c;
  }

  fmx_string kept;
  for (size_t i = 0; i < stripped.size(); ++i)
  {
    if (stripped[i] == ':')
    {
      bool inner = i > 0 && i + 1 < stripped.size() &&
                   is_word_char(stripped[i - 1]) && is_word_char(stripped[i + 1]);
      if (!inner) continue;
    }
    kept += stripped[i];
  }

  return replace_fill_runs(kept, 2).normalize_whitespace();
}

bool is_fill_artifact(const fmx_string& text)
{
  bool any = false;
  for (size_t i = 0; i < text.size(); ++i)
  {
    char c = text[i];
    if (is_fill_char(c))
    {
      any = true;
    }
    else if (!std::isspace(static_cast<unsigned char>(c)))
    {
      return false;
    }
  }
  return any;
}

bool is_colon_label(const fmx_string& text)
{
  if (text.size() < 2 || text.back() != ':')
  {
    return false;
  }
  fmx_string body = text.substr(0, text.size() - 1);
  if (body.is_numeric())
  {
    return false;
  }
  for (size_t i = 0; i < body.size(); ++i)
  {
    unsigned char c = static_cast<unsigned char>(body[i]);
    if (c >= 0x80 || std::isalpha(c))
    {
      return true;
    }
  }
  return false;
}

bool is_marker_glyph(const fmx_string& text)
{
  const std::string s = text.trim().to_std_const();
  if (s.empty())
  {
    return false;
  }
  try
  {
    if (utf8::distance(s.begin(), s.end()) != 1)
    {
      return false;
    }
    std::string::const_iterator it = s.begin();
    uint32_t cp = utf8::next(it, s.end());
    switch (cp)
    {
      case 'x':
      case 'X':
      case 0x2713: // check mark
      case 0x2714: // heavy check mark
      case 0x2611: // ballot box with check
      case 0x2612: // ballot box with x
      case 0x2717: // ballot x
      case 0x2718: // heavy ballot x
      case 0x221A: // square root, used as a tick
        return true;
      default:
        return false;
    }
  }
  catch (const utf8::exception&)
  {
    return false;
  }
}

bool contains_marker_glyph(const fmx_string& text)
{
  for (const auto& word : text.words())
  {
    fmx_string bare;
    for (size_t i = 0; i < word.size(); ++i)
    {
      if (word[i] != '[' && word[i] != ']' && word[i] != '(' && word[i] != ')')
      {
        bare += word[i];
      }
    }
    if (is_marker_glyph(bare))
    {
      return true;
    }
  }
  return false;
}

} // namespace fmx::extract
