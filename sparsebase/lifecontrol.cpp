// This file is part of Golly.
// See docs/License.html for the copyright notice.

#include "lifecontrol.h"
#include "sparselife.h"
#include "viewport.h"

lifecontrol::lifecontrol(sparselife &univarg, const viewport &viewarg) :
      univ(univarg), view(viewarg), running(true), paused(false),
      drawing(false) {}

void lifecontrol::keyup(int key) {
   switch (key) {
   case 'q':
   case KEY_ESCAPE:
      running = false ;
      break ;
   case 'p':
   case ' ':
      paused = !paused ;
      break ;
   default:
      break ;
   }
}

void lifecontrol::mousedown(int px, int py) {
   paused = true ;
   int x, y ;
   if (!view.screencell(px, py, x, y))
      return ;
   int p = univ.cell(x, y) ;
   drawing = !univ.isalive(p) ;
   univ.setcell(p, drawing) ;
}

void lifecontrol::mousedrag(int px, int py) {
   paused = true ;
   int x, y ;
   if (view.screencell(px, py, x, y))
      univ.setcell(univ.cell(x, y), drawing) ;
}

bool lifecontrol::tick() {
   if (running && !paused)
      univ.advance(1) ;
   return running ;
}

const char *lifecontrol::caption() const {
   return paused ? "Paused (SPACE/P to run)" : "Conways Game Of Life" ;
}
