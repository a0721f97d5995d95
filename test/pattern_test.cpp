// This file is part of Golly.
// See docs/License.html for the copyright notice.

#include "readpattern.h"
#include "writepattern.h"
#include "sparselife.h"
#include <gtest/gtest.h>
#include <zlib.h>
#include <cstdio>
#include <string>

namespace {

std::string temppath(const char *name) {
   return ::testing::TempDir() + name ;
}

void writefile(const std::string &path, const char *text) {
   FILE *f = fopen(path.c_str(), "wb") ;
   ASSERT_TRUE(f != 0) ;
   fputs(text, f) ;
   fclose(f) ;
}

std::string readgzfile(const std::string &path) {
   std::string text ;
   gzFile f = gzopen(path.c_str(), "rb") ;
   if (f == 0)
      return text ;
   char buf[256] ;
   int n ;
   while ((n = gzread(f, buf, sizeof(buf))) > 0)
      text.append(buf, n) ;
   gzclose(f) ;
   return text ;
}

struct patternfiles : public ::testing::Test {
   patternfiles() : univ(sparselife::create(30, 20)) {}
   ~patternfiles() { delete univ ; }
   sparselife *univ ;
} ;

} // namespace

TEST_F(patternfiles, ReadsPlainTextAtOrigin) {
   std::string path = temppath("glider.txt") ;
   writefile(path, "!Name: Glider\n"
                   ".o.\n"
                   "..o\n"
                   "ooo\n") ;
   EXPECT_TRUE(readpattern(path.c_str(), *univ, 3, 4) == 0) ;
   EXPECT_EQ(5, univ->getPopulation()) ;
   EXPECT_TRUE(univ->getcell(4, 4)) ;
   EXPECT_TRUE(univ->getcell(5, 5)) ;
   EXPECT_TRUE(univ->getcell(3, 6)) ;
   EXPECT_TRUE(univ->getcell(5, 6)) ;
   remove(path.c_str()) ;
}

TEST_F(patternfiles, HandlesDosAndMacLineEndings) {
   std::string path = temppath("endings.txt") ;
   writefile(path, "o.o\r\n.o.\r\no\ro") ;
   EXPECT_TRUE(readpattern(path.c_str(), *univ) == 0) ;
   EXPECT_TRUE(univ->getcell(0, 0)) ;
   EXPECT_TRUE(univ->getcell(2, 0)) ;
   EXPECT_TRUE(univ->getcell(1, 1)) ;
   EXPECT_TRUE(univ->getcell(0, 2)) ;
   EXPECT_TRUE(univ->getcell(0, 3)) ;
   EXPECT_EQ(5, univ->getPopulation()) ;
   remove(path.c_str()) ;
}

TEST_F(patternfiles, PositionLineOffsetsOrigin) {
   std::string path = temppath("offset.txt") ;
   writefile(path, "#C a comment\n"
                   "#P 10 -2\n"
                   "oo\n") ;
   EXPECT_TRUE(readpattern(path.c_str(), *univ, 1, 5) == 0) ;
   EXPECT_TRUE(univ->getcell(11, 3)) ;
   EXPECT_TRUE(univ->getcell(12, 3)) ;
   EXPECT_EQ(2, univ->getPopulation()) ;
   remove(path.c_str()) ;
}

TEST_F(patternfiles, BadPositionLineIsAnError) {
   std::string path = temppath("badoffset.txt") ;
   writefile(path, "#P ten\noo\n") ;
   const char *err = readpattern(path.c_str(), *univ) ;
   ASSERT_TRUE(err != 0) ;
   EXPECT_EQ(std::string("Bad #P line in pattern file."), err) ;
   EXPECT_TRUE(univ->isEmpty()) ;
   remove(path.c_str()) ;
}

TEST_F(patternfiles, OriginFarOffGridLoadsNothing) {
   std::string path = temppath("faroff.txt") ;
   writefile(path, "#P 1000000000 0\nooo\n") ;
   EXPECT_TRUE(readpattern(path.c_str(), *univ, 2000000000, 0) == 0) ;
   EXPECT_TRUE(univ->isEmpty()) ;
   writefile(path, "#P 0 -1000000000\nooo\n") ;
   EXPECT_TRUE(readpattern(path.c_str(), *univ, 0, -2000000000) == 0) ;
   EXPECT_TRUE(univ->isEmpty()) ;
   EXPECT_EQ(0, univ->numpending()) ;
   remove(path.c_str()) ;
}

TEST_F(patternfiles, LongRowsAreNotCut) {
   sparselife *wide = sparselife::create(30000, 2) ;
   ASSERT_TRUE(wide != 0) ;
   std::string row(25001, '.') ;
   row[0] = 'o' ;
   row[25000] = 'o' ;
   row += "\n" ;
   std::string path = temppath("wide.txt") ;
   writefile(path, row.c_str()) ;
   EXPECT_TRUE(readpattern(path.c_str(), *wide) == 0) ;
   EXPECT_EQ(2, wide->getPopulation()) ;
   EXPECT_TRUE(wide->getcell(25000, 0)) ;
   delete wide ;
   remove(path.c_str()) ;
}

TEST_F(patternfiles, ReadsGzippedFile) {
   std::string path = temppath("blinker.txt.gz") ;
   gzFile f = gzopen(path.c_str(), "wb") ;
   ASSERT_TRUE(f != 0) ;
   gzputs(f, "!gzipped\nooo\n") ;
   gzclose(f) ;
   EXPECT_TRUE(readpattern(path.c_str(), *univ, 28, 0) == 0) ;
   // clipped at the right edge
   EXPECT_EQ(2, univ->getPopulation()) ;
   EXPECT_TRUE(univ->getcell(28, 0)) ;
   EXPECT_TRUE(univ->getcell(29, 0)) ;
   EXPECT_FALSE(univ->getcell(0, 1)) ;
   remove(path.c_str()) ;
}

TEST_F(patternfiles, MissingFileIsAnError) {
   const char *err = readpattern(temppath("no-such-pattern.txt").c_str(), *univ) ;
   ASSERT_TRUE(err != 0) ;
   EXPECT_EQ(0u, std::string(err).find("Can't open pattern file:")) ;
}

TEST_F(patternfiles, WritesBoundingBoxWithPosition) {
   univ->paste("o..o\n"
               "....\n"
               ".o", 6, 7) ;
   std::string path = temppath("written.txt") ;
   EXPECT_TRUE(writepattern(path.c_str(), *univ, no_compression) == 0) ;
   EXPECT_EQ("!Generation: 0\n"
             "#P 6 7\n"
             "o..o\n"
             "\n"
             ".o\n", readgzfile(path)) ;
   remove(path.c_str()) ;
}

TEST_F(patternfiles, WritesEmptyUniverseAsHeaderOnly) {
   std::string path = temppath("empty.txt") ;
   EXPECT_TRUE(writepattern(path.c_str(), *univ, no_compression) == 0) ;
   EXPECT_EQ("!Generation: 0\n", readgzfile(path)) ;
   remove(path.c_str()) ;
}

TEST_F(patternfiles, GzipOutputLoadsBackInPlace) {
   univ->paste(".o.\n"
               "..o\n"
               "ooo", 10, 10) ;
   univ->advance(3) ;
   std::string path = temppath("glider3.txt.gz") ;
   EXPECT_TRUE(writepattern(path.c_str(), *univ, gzip_compression) == 0) ;
   // really compressed
   FILE *f = fopen(path.c_str(), "rb") ;
   ASSERT_TRUE(f != 0) ;
   int b0 = fgetc(f) ;
   int b1 = fgetc(f) ;
   fclose(f) ;
   EXPECT_EQ(0x1f, b0) ;
   EXPECT_EQ(0x8b, b1) ;
   sparselife *copy = sparselife::create(30, 20) ;
   ASSERT_TRUE(copy != 0) ;
   EXPECT_TRUE(readpattern(path.c_str(), *copy) == 0) ;
   EXPECT_EQ(univ->getPopulation(), copy->getPopulation()) ;
   for (int y=0; y<20; y++)
      for (int x=0; x<30; x++)
         EXPECT_EQ(univ->getcell(x, y), copy->getcell(x, y)) << x << "," << y ;
   delete copy ;
   remove(path.c_str()) ;
}

TEST_F(patternfiles, UnwritablePathIsAnError) {
   std::string path = temppath("no-such-dir/out.txt") ;
   EXPECT_TRUE(writepattern(path.c_str(), *univ, no_compression) != 0) ;
}
