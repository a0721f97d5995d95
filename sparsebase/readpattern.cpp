// This file is part of Golly.
// See docs/License.html for the copyright notice.

#include "readpattern.h"
#include "sparselife.h"
#include <zlib.h>
#include <climits>
#include <cstdio>
#include <string>

#define CR 13
#define LF 10
#define BUFFSIZE 8192
#define MAXOFFSET 1000000000

/*
 *   Buffered line reader on top of a gzFile.  gzread passes plain
 *   files through unchanged, so this handles both.
 */
class gzlinereader {
public:
   gzlinereader(gzFile f) : in(f), buffpos(0), bytesread(0), prevchar(0),
                            failed(false) {}
   bool getline(std::string &line) ;
   bool error() const { return failed ; }
private:
   int mgetchar() ;
   gzFile in ;
   char filebuff[BUFFSIZE] ;
   int buffpos, bytesread, prevchar ;
   bool failed ;
} ;

// use buffered getchar instead of slow fgetc
int gzlinereader::mgetchar() {
   if (buffpos >= bytesread) {
      if (failed)
         return EOF ;
      bytesread = gzread(in, filebuff, BUFFSIZE) ;
      buffpos = 0 ;
      if (bytesread < 0) {
         failed = true ;
         bytesread = 0 ;
      }
      if (bytesread == 0)
         return EOF ;
   }
   return (unsigned char)filebuff[buffpos++] ;
}

// handle DOS/Mac/Unix line endings; lines can be any length
bool gzlinereader::getline(std::string &line) {
   line.clear() ;
   for (;;) {
      int ch = mgetchar() ;
      switch (ch) {
         case CR:
            prevchar = CR ;
            return true ;
         case LF:
            if (prevchar != CR) {
               prevchar = LF ;
               return true ;
            }
            // if CR+LF (DOS) then ignore the LF
            prevchar = LF ;
            break ;
         case EOF:
            return !line.empty() ;
         default:
            prevchar = ch ;
            line += (char) ch ;
            break ;
      }
   }
}

static const char *build_err_str(const char *filename) {
   static char file_err_str[2048] ;
   snprintf(file_err_str, sizeof(file_err_str),
            "Can't open pattern file:\n%s", filename) ;
   return file_err_str ;
}

const char *readpattern(const char *filename, sparselife &univ, int x, int y) {
   gzFile zinstream = gzopen(filename, "rb") ;
   if (zinstream == 0)
      return build_err_str(filename) ;
   gzlinereader reader(zinstream) ;
   std::string line, text ;
   const char *errmsg = 0 ;
   int offx = 0, offy = 0 ;
   while (reader.getline(line)) {
      if (line[0] == '!')
         continue ;
      if (line[0] == '#') {
         if (line.compare(0, 3, "#P ") == 0) {
            int dx, dy ;
            if (sscanf(line.c_str() + 3, "%d %d", &dx, &dy) != 2 ||
                dx < -MAXOFFSET || dx > MAXOFFSET ||
                dy < -MAXOFFSET || dy > MAXOFFSET) {
               errmsg = "Bad #P line in pattern file." ;
               break ;
            }
            // a later #P line replaces an earlier one
            offx = dx ;
            offy = dy ;
         }
         continue ;
      }
      text += line ;
      text += '\n' ;
   }
   if (errmsg == 0 && reader.error())
      errmsg = "Error reading pattern file." ;
   gzclose(zinstream) ;
   if (errmsg == 0) {
      // an origin that cannot be an int is far off the grid
      long long px = (long long)x + offx ;
      long long py = (long long)y + offy ;
      if (px >= INT_MIN && px <= INT_MAX && py >= INT_MIN && py <= INT_MAX)
         univ.paste(text.c_str(), (int)px, (int)py) ;
   }
   return errmsg ;
}
