// This file is part of Golly.
// See docs/License.html for the copyright notice.

#include "writepattern.h"
#include "sparselife.h"
#include <zlib.h>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <streambuf>
#include <string>

class gzbuf : public std::streambuf
{
public:
   gzbuf() : file(NULL) { }
   ~gzbuf() { close(); }

   gzbuf *open(const char *path)
   {
      if (file) return NULL;
      file = gzopen(path, "wb");
      return file ? this : NULL;
   }

   gzbuf *close()
   {
      if (!file) return NULL;
      int res = gzclose(file);
      file = NULL;
      return res == Z_OK ? this : NULL;
   }

   int overflow(int c=EOF)
   {
      if (c == EOF)
         return c ;
      return gzputc(file, c) ;
   }

   std::streamsize xsputn(const char_type *s, std::streamsize n)
   {
      return gzwrite(file, s, (unsigned int)n);
   }

   int sync()
   {
      return gzflush(file, Z_SYNC_FLUSH) == Z_OK ? 0 : -1;
   }

private:
   gzFile file;
};

/*
 *   One row per line of the bounding box; dead cells after the last
 *   live cell of a row are left out.
 */
static const char *writetext(std::ostream &os, const sparselife &univ)
{
   char line[64];
   snprintf(line, sizeof(line), "!Generation: %lld\n", univ.getGeneration());
   os << line;
   int top, left, bottom, right;
   if (!univ.findedges(&top, &left, &bottom, &right))
      return NULL;
   snprintf(line, sizeof(line), "#P %d %d\n", left, top);
   os << line;
   std::string row;
   int v = 0;
   for (int cy = top; cy <= bottom; cy++) {
      row.clear();
      int cx = left;
      for (;;) {
         int skip = univ.nextcell(cx, cy, v);
         if (skip < 0 || cx + skip > right)
            break;
         row.append(skip, '.');
         row += 'o';
         cx += skip + 1;
      }
      row += '\n';
      if (!os.write(row.data(), row.size()))
         return "Failed to write output buffer!";
   }
   return NULL;
}

const char *writepattern(const char *filename, const sparselife &univ,
                         output_compression compression)
{
   // open output stream
   std::streambuf *streambuf = NULL;
   std::filebuf filebuf;
   gzbuf gzbuf;

   switch (compression)
   {
   default:  /* no output compression */
      streambuf = filebuf.open(filename, std::ios_base::out);
      break;

   case gzip_compression:
      streambuf = gzbuf.open(filename);
      break;
   }
   if (!streambuf)
      return "Can't create pattern file!";
   std::ostream os(streambuf);

   const char *errmsg = writetext(os, univ);

   if (errmsg == NULL && !os.flush())
      errmsg = "Error occurred writing file; maybe disk is full?";
   if (errmsg == NULL && compression == gzip_compression && !gzbuf.close())
      errmsg = "Error occurred writing file; maybe disk is full?";

   return errmsg;
}
