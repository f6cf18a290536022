#include <gogsync/hash/hash-calculator.hxx>

#include <openssl/evp.h>

#include <cctype>
#include <vector>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <stdexcept>

#include <gogsync/gogsync-error.hxx>

using namespace std;

namespace gogsync
{
  void hash_context::deleter::
  operator() (evp_md_ctx_st* c) const noexcept
  {
    EVP_MD_CTX_free (c);
  }

  hash_context::
  hash_context ()
    : ctx_ (EVP_MD_CTX_new ())
  {
    if (!ctx_)
      throw runtime_error ("unable to allocate digest context");

    if (EVP_DigestInit_ex (ctx_.get (), EVP_md5 (), nullptr) != 1)
      throw runtime_error ("unable to initialize MD5 digest");
  }

  hash_context::
  ~hash_context () = default;

  hash_context::
  hash_context (hash_context&&) noexcept = default;

  hash_context& hash_context::
  operator= (hash_context&&) noexcept = default;

  void hash_context::
  update (const void* d, size_t n)
  {
    if (!ctx_)
      throw logic_error ("digest context already finalized");

    if (n != 0 && EVP_DigestUpdate (ctx_.get (), d, n) != 1)
      throw runtime_error ("unable to update MD5 digest");
  }

  uint64_t hash_context::
  update (const fs::path& f, optional<uint64_t> limit)
  {
    ifstream ifs (f, ios::binary);
    if (!ifs)
      throw io_error ("unable to open file for hashing", f);

    vector<char> buf (block_size);
    uint64_t total (0);

    while (!limit || total < *limit)
    {
      size_t n (buf.size ());
      if (limit)
        n = static_cast<size_t> (min<uint64_t> (n, *limit - total));

      ifs.read (buf.data (), static_cast<streamsize> (n));
      size_t got (static_cast<size_t> (ifs.gcount ()));

      if (got != 0)
      {
        update (buf.data (), got);
        total += got;
      }

      if (!ifs)
        break;
    }

    if (ifs.bad ())
      throw io_error ("unable to read file for hashing", f);

    // A prefix that is not actually there means the file changed under us.
    //
    if (limit && total != *limit)
      throw io_error ("file is shorter than " + std::to_string (*limit) +
                      " bytes",
                      f);

    return total;
  }

  string hash_context::
  finalize ()
  {
    if (!ctx_)
      throw logic_error ("digest context already finalized");

    unsigned char h[EVP_MAX_MD_SIZE];
    unsigned int n (0);

    if (EVP_DigestFinal_ex (ctx_.get (), h, &n) != 1)
      throw runtime_error ("unable to finalize MD5 digest");

    ctx_.reset ();

    ostringstream os;
    for (unsigned int i (0); i < n; ++i)
      os << hex << setw (2) << setfill ('0') << static_cast<int> (h[i]);

    return os.str ();
  }

  string
  hash_file (const fs::path& f)
  {
    hash_context c;
    c.update (f);
    return c.finalize ();
  }

  bool
  compare_hashes (const string& x, const string& y)
  {
    if (x.size () != y.size ())
      return false;

    return equal (x.begin (),
                  x.end (),
                  y.begin (),
                  [] (char a, char b)
    {
      return tolower (static_cast<unsigned char> (a)) ==
             tolower (static_cast<unsigned char> (b));
    });
  }
}
