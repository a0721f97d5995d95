// This file is part of Golly.
// See docs/License.html for the copyright notice.

/**
 *   A bounded Life universe that updates incrementally.
 *
 *   The grid is stored with a one-cell dead border on every side, so
 *   a storage index p has its eight neighbors at p + neighborhood[i]
 *   without any bounds checks.  Every cell keeps a count of its live
 *   neighbors, and a cell is queued for the next generation only when
 *   its own state or the state of one of its neighbors changed.  The
 *   cost of a generation is therefore proportional to the size of the
 *   active region, not to the area of the grid.
 *
 *   The universe knows nothing about drawing or input; see
 *   sparsedraw.h and lifecontrol.h for code that drives it.
 */
#ifndef SPARSELIFE_H
#define SPARSELIFE_H
#include <vector>
using std::vector;

extern const char *INVALIDDIMENSION ;
extern const char *GRIDTOOLARGE ;

class sparselife {
public:
   /**
    *   Create a universe of wd by ht cells, all dead.  Returns 0 and
    *   sets *errmsg (if errmsg is non-null) when either dimension is
    *   not positive or the padded grid is too big to index.
    */
   static sparselife *create(int wd, int ht, const char **errmsg = 0) ;
   ~sparselife() ;

   int getwidth() const { return wd ; }
   int getheight() const { return ht ; }
   // number of storage slots, including the border ring
   int numcells() const { return (int)live.size() ; }

   // storage index of logical cell (x, y); no validation
   int cell(int x, int y) const { return (wd + 2) * (y + 1) + x + 1 ; }

   bool isalive(int p) const {
      return p >= 0 && p < (int)live.size() && live[p] != 0 ;
   }
   bool inbounds(int p) const {
      return p >= 0 && p < (int)live.size() && interior[p] != 0 ;
   }
   int getneighbors(int p) const { return inbounds(p) ? neighbors[p] : 0 ; }

   // logical query; cells outside the grid are dead
   bool getcell(int x, int y) const {
      return x >= 0 && x < wd && y >= 0 && y < ht && live[cell(x, y)] != 0 ;
   }

   /**
    *   Set the state of storage slot p.  Does nothing if the state is
    *   unchanged or p is not an interior cell.
    */
   void setcell(int p, bool value) ;

   /**
    *   Run the given number of generations.
    */
   void advance(int steps = 1) ;

   /**
    *   Paste a block of text with its top left corner at (x, y).
    *   Lines are separated by newlines; leading and trailing white
    *   space is removed from the block and from each line.  Every
    *   remaining character sets one cell: alive if it is livechar,
    *   dead otherwise.  Cells that fall outside the grid are dropped.
    */
   void paste(const char *s, int x, int y, char livechar = 'o') ;

   // kill every cell and reset the generation count
   void clearall() ;

   int getPopulation() const { return population ; }
   long long getGeneration() const { return generation ; }
   bool isEmpty() const { return population == 0 ; }

   // cells queued for examination by the next generation
   int numpending() const { return (int)needsupdate.size() ; }
   bool ispending(int p) const {
      return p >= 0 && p < (int)pending.size() && pending[p] != 0 ;
   }

   /**
    *   Return the distance from (x, y) to the next live cell in row y
    *   (0 if (x, y) itself is alive), or -1 if there is none.  v is
    *   set to the state of that cell.
    */
   int nextcell(int x, int y, int &v) const ;

   /**
    *   Bounding box of the live cells, inclusive.  Returns false (and
    *   leaves the arguments alone) if the universe is empty.
    */
   bool findedges(int *t, int *l, int *b, int *r) const ;

   static void setVerbose(int v) { verbose = v ; }
   static int getVerbose() { return verbose ; }

private:
   sparselife(int wdarg, int htarg) ;
   sparselife(const sparselife &) ;
   sparselife &operator=(const sparselife &) ;

   void markpending(int p) {
      if (!pending[p]) {
         pending[p] = 1 ;
         needsupdate.push_back(p) ;
      }
   }

   struct updateentry {
      int p ;
      bool wasalive ;
      int count ;
   } ;

   int wd, ht ;
   vector<unsigned char> live ;
   vector<unsigned char> interior ;     // false on the border ring
   vector<int> neighbors ;
   int neighborhood[8] ;
   // the dirty set: needsupdate holds each member once, pending[p]
   // says whether p is a member
   vector<int> needsupdate ;
   vector<unsigned char> pending ;
   vector<updateentry> snapshot ;       // reused by advance()
   int population ;
   long long generation ;
   static int verbose ;
} ;
#endif
