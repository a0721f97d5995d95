// This file is part of Golly.
// See docs/License.html for the copyright notice.

#ifndef LIFECONTROL_H
#define LIFECONTROL_H
class sparselife ;
class viewport ;

const int KEY_ESCAPE = 27 ;

/**
 *   Turns already-decoded user events into calls on a universe.
 *   Whoever owns the window feeds events in and calls tick() once
 *   per frame; this class never touches the window itself.
 *
 *   Space or 'p' toggles pause, 'q' or Escape quits.  Pressing the
 *   mouse button pauses and flips the cell under the pointer; dragging
 *   paints further cells with the state that first click produced.
 */
class lifecontrol {
public:
   lifecontrol(sparselife &univarg, const viewport &viewarg) ;
   void keyup(int key) ;
   void mousedown(int px, int py) ;
   void mousedrag(int px, int py) ;
   void quit() { running = false ; }
   // advance one generation unless paused; returns false once quit
   bool tick() ;
   bool isrunning() const { return running ; }
   bool ispaused() const { return paused ; }
   void setpaused(bool p) { paused = p ; }
   bool isdrawing() const { return drawing ; }
   const char *caption() const ;
private:
   sparselife &univ ;
   const viewport &view ;
   bool running ;
   bool paused ;
   bool drawing ;    // state painted by mousedrag
} ;
#endif
